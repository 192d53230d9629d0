#pragma once
#include "core/Base.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <volk.h>

namespace Batchline
{
    enum class ShaderResourceType
    {
        UNIFORM_BUFFER,
        STORAGE_BUFFER,
        SAMPLED_IMAGE,
        STORAGE_IMAGE,
        PUSH_CONSTANT,
        UNKNOWN,
        _MAX_ENUM,
    };

    struct ShaderResource
    {
        std::string        name;
        uint32_t           set       = 0;
        uint32_t           binding   = 0;
        uint32_t           size      = 0; // bytes, buffers only
        uint32_t           arraySize = 1;
        uint32_t           offset    = 0; // push constants only
        ShaderResourceType type      = ShaderResourceType::UNKNOWN;
    };

    // Shader variable name -> resource
    using ShaderReflectionData = std::unordered_map<std::string, ShaderResource>;

    /**
     * @brief A GLSL stage compiled with shaderc and reflected with SPIRV-Reflect.
     *
     * The SPIR-V is cached next to the source as "<file>.spv" and reused while it is newer than the source.
     * Throws std::runtime_error when the source file cannot be read.
     */
    class Shader
    {
    public:
        Shader( VkDevice device, const VolkDeviceTable* api, const std::string& filepath );
        ~Shader();

        Shader( const Shader& )            = delete;
        Shader& operator=( const Shader& ) = delete;

        bool IsValid() const { return m_module != VK_NULL_HANDLE; }

        VkShaderModule                          GetModule() const { return m_module; }
        VkShaderStageFlagBits                   GetStage() const { return m_stage; }
        const std::string&                      GetPath() const { return m_path; }
        const ShaderReflectionData&             GetReflectionData() const { return m_reflectionData; }
        const std::vector<VkPushConstantRange>& GetPushConstantRanges() const { return m_pushConstantRanges; }

        static VkShaderStageFlagBits InferStageFromPath( const std::string& filepath );

    private:
        std::vector<uint32_t> CompileOrGetCache( const std::string& source );
        std::vector<uint32_t> Compile( const std::string& source );
        void                  Reflect( const std::vector<uint32_t>& spirv );

    private:
        VkDevice               m_device = VK_NULL_HANDLE;
        const VolkDeviceTable* m_api    = nullptr;
        std::string            m_path;

        VkShaderModule        m_module = VK_NULL_HANDLE;
        VkShaderStageFlagBits m_stage  = VK_SHADER_STAGE_FLAG_BITS_MAX_ENUM;

        ShaderReflectionData             m_reflectionData;
        std::vector<VkPushConstantRange> m_pushConstantRanges;
    };
} // namespace Batchline
