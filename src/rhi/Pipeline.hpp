#pragma once
#include "core/Base.hpp"
#include "rhi/Shader.hpp"
#include <map>
#include <vector>
#include <volk.h>

namespace Batchline
{
    struct ComputePipelineDesc
    {
        Ref<Shader> shader;
    };

    struct VertexAttributeDesc
    {
        uint32_t location = 0;
        VkFormat format   = VK_FORMAT_UNDEFINED;
        uint32_t offset   = 0;
    };

    /**
     * @brief One vertex buffer binding. Instance data uses VK_VERTEX_INPUT_RATE_INSTANCE.
     */
    struct VertexBindingDesc
    {
        uint32_t                         binding   = 0;
        uint32_t                         stride    = 0;
        VkVertexInputRate                inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
        std::vector<VertexAttributeDesc> attributes;
    };

    struct GraphicsPipelineDesc
    {
        Ref<Shader> vertexShader;
        Ref<Shader> fragmentShader;

        // Empty for vertex pulling
        std::vector<VertexBindingDesc> vertexBindings;

        VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

        VkPolygonMode   polygonMode = VK_POLYGON_MODE_FILL;
        VkCullModeFlags cullMode    = VK_CULL_MODE_NONE;
        VkFrontFace     frontFace   = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        float           lineWidth   = 1.0f;

        bool        depthTestEnable  = false;
        bool        depthWriteEnable = false;
        VkCompareOp depthCompareOp   = VK_COMPARE_OP_LESS_OR_EQUAL;

        // Straight alpha blending
        bool          blendEnable         = true;
        VkBlendFactor srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        VkBlendFactor dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        VkBlendOp     colorBlendOp        = VK_BLEND_OP_ADD;
        VkBlendFactor srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        VkBlendFactor dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        VkBlendOp     alphaBlendOp        = VK_BLEND_OP_ADD;

        // Dynamic rendering targets
        std::vector<VkFormat> colorAttachmentFormats = { VK_FORMAT_R8G8B8A8_UNORM };
        VkFormat              depthAttachmentFormat  = VK_FORMAT_UNDEFINED;
    };

    namespace PipelineUtils
    {
        struct PipelineLayoutResult
        {
            VkPipelineLayout                          pipelineLayout = VK_NULL_HANDLE;
            std::map<uint32_t, VkDescriptorSetLayout> descriptorSetLayouts;
        };

        /**
         * @brief Builds descriptor set layouts and the pipeline layout from the reflection of all stages.
         * Gaps below the highest set get layouts too. A missing set 0 is recreated as the camera uniform
         * buffer so every pipeline stays layout compatible at set 0.
         */
        Result CreatePipelineLayout( VkDevice device, const VolkDeviceTable* api, const std::vector<Ref<Shader>>& shaders,
                                     PipelineLayoutResult& out );

        void DestroyPipelineLayout( VkDevice device, const VolkDeviceTable* api, const PipelineLayoutResult& resources );

        ShaderReflectionData MergeReflectionData( const std::vector<Ref<Shader>>& shaders );
    } // namespace PipelineUtils

    class ComputePipeline
    {
    public:
        ComputePipeline( VkDevice device, const VolkDeviceTable* api, const ComputePipelineDesc& desc, VkPipelineCache cache = VK_NULL_HANDLE );
        ~ComputePipeline();

        ComputePipeline( const ComputePipeline& )            = delete;
        ComputePipeline& operator=( const ComputePipeline& ) = delete;

        bool                        IsValid() const { return m_pipeline != VK_NULL_HANDLE; }
        VkPipeline                  GetHandle() const { return m_pipeline; }
        VkPipelineLayout            GetLayout() const { return m_resources.pipelineLayout; }
        const ShaderReflectionData& GetReflectionData() const { return m_reflectionData; }
        VkDescriptorSetLayout       GetDescriptorSetLayout( uint32_t set ) const;

    private:
        VkDevice                            m_device;
        const VolkDeviceTable*              m_api;
        VkPipeline                          m_pipeline = VK_NULL_HANDLE;
        ShaderReflectionData                m_reflectionData;
        PipelineUtils::PipelineLayoutResult m_resources;
    };

    class GraphicsPipeline
    {
    public:
        GraphicsPipeline( VkDevice device, const VolkDeviceTable* api, const GraphicsPipelineDesc& desc, VkPipelineCache cache = VK_NULL_HANDLE );
        ~GraphicsPipeline();

        GraphicsPipeline( const GraphicsPipeline& )            = delete;
        GraphicsPipeline& operator=( const GraphicsPipeline& ) = delete;

        bool                        IsValid() const { return m_pipeline != VK_NULL_HANDLE; }
        VkPipeline                  GetHandle() const { return m_pipeline; }
        VkPipelineLayout            GetLayout() const { return m_resources.pipelineLayout; }
        const ShaderReflectionData& GetReflectionData() const { return m_reflectionData; }
        VkDescriptorSetLayout       GetDescriptorSetLayout( uint32_t set ) const;

    private:
        VkDevice                            m_device;
        const VolkDeviceTable*              m_api;
        VkPipeline                          m_pipeline = VK_NULL_HANDLE;
        ShaderReflectionData                m_reflectionData;
        PipelineUtils::PipelineLayoutResult m_resources;
    };
} // namespace Batchline
