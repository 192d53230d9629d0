#include "rhi/Shader.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <shaderc/shaderc.hpp>
#include <spirv_reflect.h>
#include <stdexcept>

namespace Batchline
{
    namespace
    {
        std::string ReadTextFile( const std::string& filepath )
        {
            std::ifstream in( filepath, std::ios::in | std::ios::binary );
            if( !in )
            {
                BL_CORE_CRITICAL( "Could not open shader file: {}", filepath );
                throw std::runtime_error( "Shader file not found: " + filepath );
            }

            std::string contents;
            in.seekg( 0, std::ios::end );
            contents.resize( static_cast<size_t>( in.tellg() ) );
            in.seekg( 0, std::ios::beg );
            in.read( contents.data(), static_cast<std::streamsize>( contents.size() ) );
            return contents;
        }

        std::vector<uint32_t> ReadSpirvFile( const std::filesystem::path& path )
        {
            std::ifstream in( path, std::ios::in | std::ios::binary );
            if( !in )
                return {};

            in.seekg( 0, std::ios::end );
            const size_t fileSize = static_cast<size_t>( in.tellg() );
            in.seekg( 0, std::ios::beg );

            std::vector<uint32_t> spirv( fileSize / sizeof( uint32_t ) );
            in.read( reinterpret_cast<char*>( spirv.data() ), static_cast<std::streamsize>( spirv.size() * sizeof( uint32_t ) ) );
            return spirv;
        }

        ShaderResourceType ToResourceType( SpvReflectDescriptorType type )
        {
            switch( type )
            {
                case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER:
                    return ShaderResourceType::UNIFORM_BUFFER;
                case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER:
                    return ShaderResourceType::STORAGE_BUFFER;
                case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER:
                    return ShaderResourceType::SAMPLED_IMAGE;
                case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_IMAGE:
                    return ShaderResourceType::STORAGE_IMAGE;
                default:
                    return ShaderResourceType::UNKNOWN;
            }
        }
    } // namespace

    Shader::Shader( VkDevice device, const VolkDeviceTable* api, const std::string& filepath )
        : m_device( device )
        , m_api( api )
        , m_path( std::filesystem::path( filepath ).generic_string() )
    {
        BL_CORE_ASSERT( m_api, "VolkDeviceTable is null!" );

        const std::string source = ReadTextFile( filepath );
        m_stage                  = InferStageFromPath( filepath );

        std::vector<uint32_t> spirv = CompileOrGetCache( source );
        if( spirv.empty() )
        {
            BL_CORE_ERROR( "Failed to compile or load shader: {}", m_path );
            return;
        }

        VkShaderModuleCreateInfo createInfo = { VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO };
        createInfo.codeSize                 = spirv.size() * sizeof( uint32_t );
        createInfo.pCode                    = spirv.data();

        if( m_api->vkCreateShaderModule( m_device, &createInfo, nullptr, &m_module ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create shader module for: {}", m_path );
            m_module = VK_NULL_HANDLE;
            return;
        }

        Reflect( spirv );
    }

    Shader::~Shader()
    {
        if( m_module != VK_NULL_HANDLE )
        {
            m_api->vkDestroyShaderModule( m_device, m_module, nullptr );
        }
    }

    std::vector<uint32_t> Shader::CompileOrGetCache( const std::string& source )
    {
        const std::filesystem::path sourcePath( m_path );
        std::filesystem::path       cachePath = sourcePath;
        cachePath += ".spv";

        std::error_code ec;
        const bool      cacheExists = std::filesystem::exists( cachePath, ec );
        if( cacheExists && std::filesystem::last_write_time( sourcePath, ec ) <= std::filesystem::last_write_time( cachePath, ec ) && !ec )
        {
            std::vector<uint32_t> cached = ReadSpirvFile( cachePath );
            if( !cached.empty() )
            {
                BL_CORE_TRACE( "Loading shader from cache: {}", cachePath.generic_string() );
                return cached;
            }
            BL_CORE_WARN( "Shader cache unreadable: {}. Recompiling.", cachePath.generic_string() );
        }

        std::vector<uint32_t> spirv = Compile( source );
        if( spirv.empty() )
            return spirv;

        std::ofstream out( cachePath, std::ios::out | std::ios::binary );
        if( out )
        {
            out.write( reinterpret_cast<const char*>( spirv.data() ), static_cast<std::streamsize>( spirv.size() * sizeof( uint32_t ) ) );
        }
        else
        {
            // Read-only asset trees still work, they just recompile every run
            BL_CORE_WARN( "Failed to write shader cache to: {}", cachePath.generic_string() );
        }

        return spirv;
    }

    std::vector<uint32_t> Shader::Compile( const std::string& source )
    {
        BL_CORE_INFO( "Compiling shader: {}", m_path );

        shaderc::Compiler       compiler;
        shaderc::CompileOptions options;
        options.SetTargetEnvironment( shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3 );
        options.SetOptimizationLevel( shaderc_optimization_level_performance );
        // Keeps block and variable names for reflection
        options.SetGenerateDebugInfo();

        shaderc_shader_kind kind;
        switch( m_stage )
        {
            case VK_SHADER_STAGE_VERTEX_BIT:
                kind = shaderc_glsl_vertex_shader;
                break;
            case VK_SHADER_STAGE_FRAGMENT_BIT:
                kind = shaderc_glsl_fragment_shader;
                break;
            case VK_SHADER_STAGE_COMPUTE_BIT:
                kind = shaderc_glsl_compute_shader;
                break;
            default:
                kind = shaderc_glsl_infer_from_source;
                break;
        }

        shaderc::SpvCompilationResult module = compiler.CompileGlslToSpv( source, kind, m_path.c_str(), options );
        if( module.GetCompilationStatus() != shaderc_compilation_status_success )
        {
            BL_CORE_CRITICAL( "Shader compilation failed ({0}):\n{1}", m_path, module.GetErrorMessage() );
            return {};
        }

        return std::vector<uint32_t>( module.cbegin(), module.cend() );
    }

    void Shader::Reflect( const std::vector<uint32_t>& spirv )
    {
        SpvReflectShaderModule module;
        if( spvReflectCreateShaderModule( spirv.size() * sizeof( uint32_t ), spirv.data(), &module ) != SPV_REFLECT_RESULT_SUCCESS )
        {
            BL_CORE_ERROR( "SPIRV-Reflect failed for {}", m_path );
            return;
        }

        uint32_t count = 0;
        spvReflectEnumerateDescriptorSets( &module, &count, nullptr );
        std::vector<SpvReflectDescriptorSet*> sets( count );
        spvReflectEnumerateDescriptorSets( &module, &count, sets.data() );

        for( const SpvReflectDescriptorSet* set: sets )
        {
            for( uint32_t i = 0; i < set->binding_count; ++i )
            {
                const SpvReflectDescriptorBinding* binding = set->bindings[ i ];

                ShaderResource resource;
                resource.set       = binding->set;
                resource.binding   = binding->binding;
                resource.arraySize = binding->count;
                resource.type      = ToResourceType( binding->descriptor_type );

                // Instance name first, block type name for anonymous blocks
                if( binding->name && std::strlen( binding->name ) > 0 )
                    resource.name = binding->name;
                else if( binding->type_description && binding->type_description->type_name )
                    resource.name = binding->type_description->type_name;
                else
                    resource.name = "set" + std::to_string( binding->set ) + "_binding" + std::to_string( binding->binding );

                if( resource.type == ShaderResourceType::UNKNOWN )
                {
                    BL_CORE_WARN( "Unsupported resource type in shader {}: {}", m_path, resource.name );
                }
                else if( resource.type == ShaderResourceType::UNIFORM_BUFFER || resource.type == ShaderResourceType::STORAGE_BUFFER )
                {
                    resource.size = binding->block.padded_size;
                }

                m_reflectionData[ resource.name ] = resource;
            }
        }

        uint32_t pcCount = 0;
        spvReflectEnumeratePushConstantBlocks( &module, &pcCount, nullptr );
        std::vector<SpvReflectBlockVariable*> pcs( pcCount );
        spvReflectEnumeratePushConstantBlocks( &module, &pcCount, pcs.data() );

        for( const SpvReflectBlockVariable* pc: pcs )
        {
            VkPushConstantRange range{};
            range.offset     = pc->offset;
            range.size       = pc->size;
            range.stageFlags = m_stage;
            m_pushConstantRanges.push_back( range );

            ShaderResource resource;
            resource.name   = pc->name ? pc->name : "pushConstants";
            resource.size   = pc->size;
            resource.offset = pc->offset;
            resource.type   = ShaderResourceType::PUSH_CONSTANT;
            m_reflectionData[ resource.name ] = resource;
        }

        spvReflectDestroyShaderModule( &module );
    }

    VkShaderStageFlagBits Shader::InferStageFromPath( const std::string& filepath )
    {
        const std::string extension = std::filesystem::path( filepath ).extension().string();
        if( extension == ".vert" )
            return VK_SHADER_STAGE_VERTEX_BIT;
        if( extension == ".frag" )
            return VK_SHADER_STAGE_FRAGMENT_BIT;
        if( extension == ".comp" )
            return VK_SHADER_STAGE_COMPUTE_BIT;

        BL_CORE_WARN( "Could not infer shader stage from file extension: {}", filepath );
        return VK_SHADER_STAGE_ALL;
    }
} // namespace Batchline
