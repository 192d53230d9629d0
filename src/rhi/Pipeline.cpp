#include "rhi/Pipeline.hpp"

#include <algorithm>

namespace Batchline
{
    static VkDescriptorType MapResourceTypeToVulkan( ShaderResourceType type )
    {
        switch( type )
        {
            case ShaderResourceType::UNIFORM_BUFFER:
                return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            case ShaderResourceType::STORAGE_BUFFER:
                return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            case ShaderResourceType::SAMPLED_IMAGE:
                return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            case ShaderResourceType::STORAGE_IMAGE:
                return VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
            default:
                return VK_DESCRIPTOR_TYPE_MAX_ENUM;
        }
    }

    namespace PipelineUtils
    {
        Result CreatePipelineLayout( VkDevice device, const VolkDeviceTable* api, const std::vector<Ref<Shader>>& shaders,
                                     PipelineLayoutResult& out )
        {
            // set -> binding -> resource
            std::map<uint32_t, std::map<uint32_t, ShaderResource>> mergedResources;
            std::map<uint32_t, VkShaderStageFlags>                 bindingStages;
            std::vector<VkPushConstantRange>                       pushConstants;

            for( const auto& shader: shaders )
            {
                if( !shader )
                    continue;

                for( const auto& [ name, res ]: shader->GetReflectionData() )
                {
                    if( res.type == ShaderResourceType::PUSH_CONSTANT || res.type == ShaderResourceType::UNKNOWN )
                        continue;
                    mergedResources[ res.set ][ res.binding ] = res;
                }

                // Same block declared by several stages becomes one range
                for( const VkPushConstantRange& range: shader->GetPushConstantRanges() )
                {
                    auto it = std::find_if( pushConstants.begin(), pushConstants.end(), [ & ]( const VkPushConstantRange& r ) {
                        return r.offset == range.offset && r.size == range.size;
                    } );
                    if( it != pushConstants.end() )
                        it->stageFlags |= range.stageFlags;
                    else
                        pushConstants.push_back( range );
                }
            }

            auto createSetLayout = [ & ]( uint32_t setIndex, const std::vector<VkDescriptorSetLayoutBinding>& bindings ) {
                VkDescriptorSetLayoutCreateInfo layoutInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO };
                layoutInfo.bindingCount                    = static_cast<uint32_t>( bindings.size() );
                layoutInfo.pBindings                       = bindings.empty() ? nullptr : bindings.data();

                VkDescriptorSetLayout layout = VK_NULL_HANDLE;
                if( api->vkCreateDescriptorSetLayout( device, &layoutInfo, nullptr, &layout ) != VK_SUCCESS )
                {
                    BL_CORE_CRITICAL( "Failed to create descriptor set layout for set {}", setIndex );
                    return false;
                }
                out.descriptorSetLayouts[ setIndex ] = layout;
                return true;
            };

            for( const auto& [ setIndex, bindingsMap ]: mergedResources )
            {
                std::vector<VkDescriptorSetLayoutBinding> vkBindings;
                for( const auto& [ bindingIndex, res ]: bindingsMap )
                {
                    VkDescriptorSetLayoutBinding b{};
                    b.binding         = bindingIndex;
                    b.descriptorType  = MapResourceTypeToVulkan( res.type );
                    b.descriptorCount = res.arraySize;
                    b.stageFlags      = VK_SHADER_STAGE_ALL;
                    vkBindings.push_back( b );
                }

                if( !createSetLayout( setIndex, vkBindings ) )
                {
                    DestroyPipelineLayout( device, api, out );
                    out = {};
                    return Result::FAIL;
                }
            }

            if( !out.descriptorSetLayouts.empty() )
            {
                const uint32_t maxSet = out.descriptorSetLayouts.rbegin()->first;
                for( uint32_t i = 0; i < maxSet; ++i )
                {
                    if( out.descriptorSetLayouts.count( i ) )
                        continue;

                    std::vector<VkDescriptorSetLayoutBinding> bindings;
                    if( i == 0 )
                    {
                        // Stage did not use the camera, keep set 0 compatible with the other pipelines
                        VkDescriptorSetLayoutBinding camera{};
                        camera.binding         = 0;
                        camera.descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
                        camera.descriptorCount = 1;
                        camera.stageFlags      = VK_SHADER_STAGE_ALL;
                        bindings.push_back( camera );
                    }

                    if( !createSetLayout( i, bindings ) )
                    {
                        DestroyPipelineLayout( device, api, out );
                        out = {};
                        return Result::FAIL;
                    }
                }
            }

            std::vector<VkDescriptorSetLayout> contiguousLayouts;
            for( const auto& [ set, layout ]: out.descriptorSetLayouts )
            {
                contiguousLayouts.push_back( layout );
            }

            VkPipelineLayoutCreateInfo pipelineLayoutInfo = { VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO };
            pipelineLayoutInfo.setLayoutCount             = static_cast<uint32_t>( contiguousLayouts.size() );
            pipelineLayoutInfo.pSetLayouts                = contiguousLayouts.data();
            pipelineLayoutInfo.pushConstantRangeCount     = static_cast<uint32_t>( pushConstants.size() );
            pipelineLayoutInfo.pPushConstantRanges        = pushConstants.data();

            if( api->vkCreatePipelineLayout( device, &pipelineLayoutInfo, nullptr, &out.pipelineLayout ) != VK_SUCCESS )
            {
                BL_CORE_CRITICAL( "Failed to create pipeline layout!" );
                out.pipelineLayout = VK_NULL_HANDLE;
                DestroyPipelineLayout( device, api, out );
                out = {};
                return Result::FAIL;
            }

            return Result::SUCCESS;
        }

        void DestroyPipelineLayout( VkDevice device, const VolkDeviceTable* api, const PipelineLayoutResult& resources )
        {
            if( resources.pipelineLayout != VK_NULL_HANDLE )
            {
                api->vkDestroyPipelineLayout( device, resources.pipelineLayout, nullptr );
            }
            for( const auto& [ set, layout ]: resources.descriptorSetLayouts )
            {
                api->vkDestroyDescriptorSetLayout( device, layout, nullptr );
            }
        }

        ShaderReflectionData MergeReflectionData( const std::vector<Ref<Shader>>& shaders )
        {
            ShaderReflectionData merged;
            for( const auto& shader: shaders )
            {
                if( !shader )
                    continue;

                // Blocks shared by several stages keep the first stage's entry
                for( const auto& [ name, resource ]: shader->GetReflectionData() )
                {
                    merged.emplace( name, resource );
                }
            }
            return merged;
        }
    } // namespace PipelineUtils

    ComputePipeline::ComputePipeline( VkDevice device, const VolkDeviceTable* api, const ComputePipelineDesc& desc, VkPipelineCache cache )
        : m_device( device )
        , m_api( api )
    {
        if( !desc.shader || !desc.shader->IsValid() )
        {
            BL_CORE_ERROR( "ComputePipeline requires a valid compute shader." );
            return;
        }

        if( PipelineUtils::CreatePipelineLayout( m_device, m_api, { desc.shader }, m_resources ) != Result::SUCCESS )
            return;
        m_reflectionData = desc.shader->GetReflectionData();

        VkComputePipelineCreateInfo pipelineInfo = { VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO };
        pipelineInfo.layout                      = m_resources.pipelineLayout;
        pipelineInfo.stage.sType                 = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        pipelineInfo.stage.stage                 = VK_SHADER_STAGE_COMPUTE_BIT;
        pipelineInfo.stage.module                = desc.shader->GetModule();
        pipelineInfo.stage.pName                 = "main";

        if( m_api->vkCreateComputePipelines( m_device, cache, 1, &pipelineInfo, nullptr, &m_pipeline ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create compute pipeline for {}", desc.shader->GetPath() );
            m_pipeline = VK_NULL_HANDLE;
        }
    }

    ComputePipeline::~ComputePipeline()
    {
        if( m_pipeline )
            m_api->vkDestroyPipeline( m_device, m_pipeline, nullptr );
        PipelineUtils::DestroyPipelineLayout( m_device, m_api, m_resources );
    }

    VkDescriptorSetLayout ComputePipeline::GetDescriptorSetLayout( uint32_t set ) const
    {
        auto it = m_resources.descriptorSetLayouts.find( set );
        return ( it != m_resources.descriptorSetLayouts.end() ) ? it->second : VK_NULL_HANDLE;
    }

    GraphicsPipeline::GraphicsPipeline( VkDevice device, const VolkDeviceTable* api, const GraphicsPipelineDesc& desc, VkPipelineCache cache )
        : m_device( device )
        , m_api( api )
    {
        if( !desc.vertexShader || !desc.vertexShader->IsValid() )
        {
            BL_CORE_ERROR( "GraphicsPipeline requires a valid vertex shader." );
            return;
        }

        std::vector<Ref<Shader>> shaders = { desc.vertexShader };
        if( desc.fragmentShader )
            shaders.push_back( desc.fragmentShader );

        if( PipelineUtils::CreatePipelineLayout( m_device, m_api, shaders, m_resources ) != Result::SUCCESS )
            return;
        m_reflectionData = PipelineUtils::MergeReflectionData( shaders );

        std::vector<VkPipelineShaderStageCreateInfo> shaderStages;
        for( const auto& shader: shaders )
        {
            VkPipelineShaderStageCreateInfo stage = { VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO };
            stage.stage                           = shader->GetStage();
            stage.module                          = shader->GetModule();
            stage.pName                           = "main";
            shaderStages.push_back( stage );
        }

        // Vertex and instance streams
        std::vector<VkVertexInputBindingDescription>   bindings;
        std::vector<VkVertexInputAttributeDescription> attributes;
        for( const VertexBindingDesc& binding: desc.vertexBindings )
        {
            bindings.push_back( { binding.binding, binding.stride, binding.inputRate } );
            for( const VertexAttributeDesc& attribute: binding.attributes )
            {
                attributes.push_back( { attribute.location, binding.binding, attribute.format, attribute.offset } );
            }
        }

        VkPipelineVertexInputStateCreateInfo vertexInputInfo = { VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO };
        vertexInputInfo.vertexBindingDescriptionCount        = static_cast<uint32_t>( bindings.size() );
        vertexInputInfo.pVertexBindingDescriptions           = bindings.data();
        vertexInputInfo.vertexAttributeDescriptionCount      = static_cast<uint32_t>( attributes.size() );
        vertexInputInfo.pVertexAttributeDescriptions         = attributes.data();

        VkPipelineInputAssemblyStateCreateInfo inputAssembly = { VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO };
        inputAssembly.topology                               = desc.topology;
        inputAssembly.primitiveRestartEnable                 = VK_FALSE;

        VkPipelineViewportStateCreateInfo viewportState = { VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO };
        viewportState.viewportCount                     = 1;
        viewportState.scissorCount                      = 1;

        VkPipelineRasterizationStateCreateInfo rasterizer = { VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO };
        rasterizer.polygonMode                            = desc.polygonMode;
        rasterizer.lineWidth                              = desc.lineWidth;
        rasterizer.cullMode                               = desc.cullMode;
        rasterizer.frontFace                              = desc.frontFace;

        VkPipelineMultisampleStateCreateInfo multisampling = { VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO };
        multisampling.rasterizationSamples                 = VK_SAMPLE_COUNT_1_BIT;

        VkPipelineDepthStencilStateCreateInfo depthStencil = { VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO };
        depthStencil.depthTestEnable                       = desc.depthTestEnable;
        depthStencil.depthWriteEnable                      = desc.depthWriteEnable;
        depthStencil.depthCompareOp                        = desc.depthCompareOp;

        std::vector<VkPipelineColorBlendAttachmentState> colorBlendAttachments;
        for( size_t i = 0; i < desc.colorAttachmentFormats.size(); ++i )
        {
            VkPipelineColorBlendAttachmentState attachment{};
            attachment.colorWriteMask =
                VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
            attachment.blendEnable         = desc.blendEnable;
            attachment.srcColorBlendFactor = desc.srcColorBlendFactor;
            attachment.dstColorBlendFactor = desc.dstColorBlendFactor;
            attachment.colorBlendOp        = desc.colorBlendOp;
            attachment.srcAlphaBlendFactor = desc.srcAlphaBlendFactor;
            attachment.dstAlphaBlendFactor = desc.dstAlphaBlendFactor;
            attachment.alphaBlendOp        = desc.alphaBlendOp;
            colorBlendAttachments.push_back( attachment );
        }

        VkPipelineColorBlendStateCreateInfo colorBlending = { VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO };
        colorBlending.attachmentCount                     = static_cast<uint32_t>( colorBlendAttachments.size() );
        colorBlending.pAttachments                        = colorBlendAttachments.data();

        const VkDynamicState             dynamicStates[] = { VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR };
        VkPipelineDynamicStateCreateInfo dynamicState    = { VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO };
        dynamicState.dynamicStateCount                   = 2;
        dynamicState.pDynamicStates                      = dynamicStates;

        VkPipelineRenderingCreateInfo renderingInfo = { VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO };
        renderingInfo.colorAttachmentCount          = static_cast<uint32_t>( desc.colorAttachmentFormats.size() );
        renderingInfo.pColorAttachmentFormats       = desc.colorAttachmentFormats.data();
        renderingInfo.depthAttachmentFormat         = desc.depthAttachmentFormat;

        VkGraphicsPipelineCreateInfo pipelineInfo = { VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO };
        pipelineInfo.pNext                        = &renderingInfo;
        pipelineInfo.stageCount                   = static_cast<uint32_t>( shaderStages.size() );
        pipelineInfo.pStages                      = shaderStages.data();
        pipelineInfo.pVertexInputState            = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState          = &inputAssembly;
        pipelineInfo.pViewportState               = &viewportState;
        pipelineInfo.pRasterizationState          = &rasterizer;
        pipelineInfo.pMultisampleState            = &multisampling;
        pipelineInfo.pDepthStencilState           = &depthStencil;
        pipelineInfo.pColorBlendState             = &colorBlending;
        pipelineInfo.pDynamicState                = &dynamicState;
        pipelineInfo.layout                       = m_resources.pipelineLayout;
        pipelineInfo.renderPass                   = VK_NULL_HANDLE;

        if( m_api->vkCreateGraphicsPipelines( m_device, cache, 1, &pipelineInfo, nullptr, &m_pipeline ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create graphics pipeline for {}", desc.vertexShader->GetPath() );
            m_pipeline = VK_NULL_HANDLE;
        }
    }

    GraphicsPipeline::~GraphicsPipeline()
    {
        if( m_pipeline )
            m_api->vkDestroyPipeline( m_device, m_pipeline, nullptr );
        PipelineUtils::DestroyPipelineLayout( m_device, m_api, m_resources );
    }

    VkDescriptorSetLayout GraphicsPipeline::GetDescriptorSetLayout( uint32_t set ) const
    {
        auto it = m_resources.descriptorSetLayouts.find( set );
        return ( it != m_resources.descriptorSetLayouts.end() ) ? it->second : VK_NULL_HANDLE;
    }

} // namespace Batchline
