#pragma once
#include "renderer/InstanceLayout.hpp"
#include "renderer/RendererConfig.hpp"

namespace Batchline
{
    class FrameBackend;

    /**
     * @brief Growth policy shared by host staging and device buffers.
     * Doubles from initialCapacity until required fits. Never returns less than current.
     */
    uint64_t ComputeGrownCapacity( uint64_t current, uint64_t required, uint64_t initial );

    /**
     * @brief Per-frame list of encoded records for one draw class.
     *
     * Owned by the FrameOrchestrator. Clear() keeps the allocation so a steady scene stops allocating after the
     * first few frames. Not thread safe: pushes from several threads must be serialized by the caller.
     */
    class InstanceBatch
    {
    public:
        InstanceBatch( DrawClass drawClass, const BatchConfig& config );

        /**
         * @brief Appends a record. Amortized O(1).
         * @return BUFFER_OVERFLOW once maxInstances is reached (the batch is then flagged for this frame),
         *         INVALID_ARGS if the record belongs to another class.
         */
        Result Push( const InstanceRecord& record );

        void Clear();

        /**
         * @brief Hands the packed records to the backend. No-op for an empty batch.
         */
        Result Upload( FrameBackend& backend ) const;

        InstanceRecord GetRecord( uint32_t index ) const;

        DrawClass       GetDrawClass() const { return m_drawClass; }
        uint32_t        GetCount() const { return m_count; }
        uint32_t        GetCapacity() const { return m_capacity; }
        bool            IsEmpty() const { return m_count == 0; }
        bool            IsOverflowed() const { return m_overflowed; }
        uint32_t        GetStrideWords() const { return m_strideWords; }
        const uint32_t* GetData() const { return m_words.data(); }
        uint64_t        GetSizeBytes() const { return static_cast<uint64_t>( m_count ) * m_strideWords * sizeof( uint32_t ); }

    private:
        DrawClass             m_drawClass;
        BatchConfig           m_config;
        uint32_t              m_strideWords = 0;
        uint32_t              m_count       = 0;
        uint32_t              m_capacity    = 0;
        bool                  m_overflowed  = false;
        std::vector<uint32_t> m_words;
    };
} // namespace Batchline
