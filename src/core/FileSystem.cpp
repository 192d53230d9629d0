#include "core/FileSystem.hpp"

namespace Batchline
{
    std::filesystem::path FileSystem::s_rootDirectory;

    void FileSystem::Init()
    {
        if( !s_rootDirectory.empty() )
        {
            return;
        }

#if defined( BL_ASSET_DIR )
        s_rootDirectory = std::filesystem::path( BL_ASSET_DIR );
        BL_CORE_INFO( "FileSystem: DEV asset root '{}'", s_rootDirectory.string() );
#else
        s_rootDirectory = std::filesystem::current_path() / "assets";
        BL_CORE_INFO( "FileSystem: RELEASE asset root '{}'", s_rootDirectory.string() );
#endif

        if( !std::filesystem::exists( s_rootDirectory ) )
        {
            BL_CORE_CRITICAL( "FileSystem: Assets directory does not exist at: {}", s_rootDirectory.string() );
        }
    }

    void FileSystem::SetRoot( const std::filesystem::path& root )
    {
        s_rootDirectory = root;
        BL_CORE_INFO( "FileSystem: asset root set to '{}'", s_rootDirectory.string() );
    }

    std::filesystem::path FileSystem::GetPath( const std::string& path )
    {
        return s_rootDirectory / path;
    }

    const std::filesystem::path& FileSystem::GetRoot()
    {
        return s_rootDirectory;
    }

} // namespace Batchline
