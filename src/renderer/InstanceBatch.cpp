#include "renderer/InstanceBatch.hpp"

#include "renderer/FrameBackend.hpp"
#include <algorithm>

namespace Batchline
{
    uint64_t ComputeGrownCapacity( uint64_t current, uint64_t required, uint64_t initial )
    {
        if( required <= current )
            return current;

        uint64_t capacity = std::max<uint64_t>( { current, initial, 1 } );
        while( capacity < required )
        {
            capacity *= 2;
        }
        return capacity;
    }

    InstanceBatch::InstanceBatch( DrawClass drawClass, const BatchConfig& config )
        : m_drawClass( drawClass )
        , m_config( config )
        , m_strideWords( InstanceLayout::StrideWords( drawClass ) )
    {
    }

    Result InstanceBatch::Push( const InstanceRecord& record )
    {
        if( record.drawClass != m_drawClass )
        {
            BL_CORE_ERROR( "InstanceBatch({}): record of class {} rejected.", toString( m_drawClass ), toString( record.drawClass ) );
            return Result::INVALID_ARGS;
        }

        if( m_count >= m_config.maxInstances )
        {
            if( !m_overflowed )
            {
                BL_CORE_ERROR( "InstanceBatch({}): hard cap of {} instances reached.", toString( m_drawClass ), m_config.maxInstances );
            }
            m_overflowed = true;
            return Result::BUFFER_OVERFLOW;
        }

        if( m_count == m_capacity )
        {
            const uint64_t grown = ComputeGrownCapacity( m_capacity, static_cast<uint64_t>( m_count ) + 1, m_config.initialCapacity );
            m_capacity           = static_cast<uint32_t>( std::min<uint64_t>( grown, m_config.maxInstances ) );
            m_words.resize( static_cast<size_t>( m_capacity ) * m_strideWords );
        }

        std::copy_n( record.words.begin(), m_strideWords, m_words.begin() + static_cast<size_t>( m_count ) * m_strideWords );
        ++m_count;
        return Result::SUCCESS;
    }

    void InstanceBatch::Clear()
    {
        m_count      = 0;
        m_overflowed = false;
    }

    Result InstanceBatch::Upload( FrameBackend& backend ) const
    {
        if( IsEmpty() )
            return Result::SUCCESS;

        return backend.UploadInstances( m_drawClass, m_words.data(), m_count );
    }

    InstanceRecord InstanceBatch::GetRecord( uint32_t index ) const
    {
        InstanceRecord record;
        record.drawClass = m_drawClass;
        if( index >= m_count )
        {
            BL_CORE_ERROR( "InstanceBatch::GetRecord index {} out of range ({}).", index, m_count );
            return record;
        }

        std::copy_n( m_words.begin() + static_cast<size_t>( index ) * m_strideWords, m_strideWords, record.words.begin() );
        return record;
    }
} // namespace Batchline
