#pragma once
#include "core/Base.hpp"
#include <filesystem>
#include <string>

namespace Batchline
{
    /**
     * @brief Resolves asset paths (shaders, atlases) against the asset root.
     * In development builds the root is the source tree's assets directory (BL_ASSET_DIR),
     * otherwise it is "assets" next to the working directory.
     */
    class FileSystem
    {
    public:
        static void Init();

        /**
         * @brief Overrides the asset root. Used by tests and tools that ship their own assets.
         */
        static void SetRoot( const std::filesystem::path& root );

        /**
         * @brief Resolves a relative asset path.
         * @param path Relative path (e.g., "shaders/compute/cull_instances.comp")
         */
        static std::filesystem::path GetPath( const std::string& path );

        static const std::filesystem::path& GetRoot();

    private:
        static std::filesystem::path s_rootDirectory;
    };
} // namespace Batchline
