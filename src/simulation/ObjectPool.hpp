#pragma once
#include "core/Base.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>

namespace Hypercube
{
    /**
     * @brief Slot storage with generational handles.
     * Values live inline (no per-object heap allocation). Slots are pre-allocated and
     * recycled through a LIFO free list; when the free list runs dry the pool doubles,
     * never beyond maxCapacity. Iteration visits used slots in slot order.
     */
    template<typename T, typename HandleType>
    class ObjectPool
    {
        struct Slot
        {
            T        value{};
            uint32_t generation = 1; // 0 is reserved for Invalid handles
            bool     used       = false;
        };

    public:
        ObjectPool( uint32_t initialCapacity, uint32_t maxCapacity )
            : m_maxCapacity( std::max( maxCapacity, initialCapacity ) )
        {
            Grow( initialCapacity );
        }

        /**
         * @brief Takes a free slot, growing the pool if necessary.
         * @return Handle to a default-initialized value, or HandleType::Invalid when exhausted.
         */
        HandleType Allocate()
        {
            if( m_freeIndices.empty() )
            {
                uint32_t capacity = GetCapacity();
                if( capacity >= m_maxCapacity )
                    return HandleType::Invalid;

                Grow( std::min( std::max( capacity * 2, 1u ), m_maxCapacity ) );
            }

            uint32_t index = m_freeIndices.back();
            m_freeIndices.pop_back();

            Slot& slot = m_slots[ index ];
            HC_CORE_ASSERT( !slot.used, "Free list handed out a slot that is in use" );
            slot.value = T{};
            slot.used  = true;
            m_allocatedCount++;

            return HandleType( index, slot.generation );
        }

        /**
         * @brief Returns a slot to the free list and invalidates every handle to it.
         * @return false if the handle is invalid or stale.
         */
        bool Release( HandleType handle )
        {
            Slot* slot = Resolve( handle );
            if( !slot )
            {
                HC_CORE_WARN( "[ObjectPool] Attempted to release invalid/stale handle." );
                return false;
            }

            slot->used = false;
            slot->generation++;
            if( slot->generation == 0 )
                slot->generation = 1;

            m_freeIndices.push_back( handle.GetIndex() );
            m_allocatedCount--;
            return true;
        }

        /**
         * @brief Retrieves a pointer to the value.
         * @return Pointer to T or nullptr if the handle is invalid/stale.
         */
        T* Get( HandleType handle )
        {
            Slot* slot = Resolve( handle );
            return slot ? &slot->value : nullptr;
        }

        const T* Get( HandleType handle ) const
        {
            const Slot* slot = const_cast<ObjectPool*>( this )->Resolve( handle );
            return slot ? &slot->value : nullptr;
        }

        bool IsValid( HandleType handle ) const { return Get( handle ) != nullptr; }

        void Clear()
        {
            for( uint32_t i = 0; i < m_slots.size(); ++i )
            {
                if( m_slots[ i ].used )
                {
                    Release( HandleType( i, m_slots[ i ].generation ) );
                }
            }
        }

        template<typename Func>
        void ForEach( Func func )
        {
            for( uint32_t i = 0; i < m_slots.size(); ++i )
            {
                Slot& slot = m_slots[ i ];
                if( slot.used )
                {
                    func( HandleType( i, slot.generation ), slot.value );
                }
            }
        }

        template<typename Func>
        void ForEach( Func func ) const
        {
            for( uint32_t i = 0; i < m_slots.size(); ++i )
            {
                const Slot& slot = m_slots[ i ];
                if( slot.used )
                {
                    func( HandleType( i, slot.generation ), slot.value );
                }
            }
        }

        uint32_t GetCapacity() const { return static_cast<uint32_t>( m_slots.size() ); }
        uint32_t GetMaxCapacity() const { return m_maxCapacity; }
        uint32_t GetAllocatedCount() const { return m_allocatedCount; }
        uint32_t GetFreeCount() const { return static_cast<uint32_t>( m_freeIndices.size() ); }

        // Slots still obtainable, counting growth headroom
        uint32_t GetAvailableCount() const { return GetFreeCount() + ( m_maxCapacity - GetCapacity() ); }

    private:
        Slot* Resolve( HandleType handle )
        {
            if( !handle.IsValid() )
                return nullptr;

            uint32_t index = handle.GetIndex();
            if( index >= m_slots.size() )
                return nullptr;

            Slot& slot = m_slots[ index ];
            if( !slot.used || slot.generation != handle.GetGeneration() )
                return nullptr;

            return &slot;
        }

        void Grow( uint32_t newCapacity )
        {
            uint32_t oldCapacity = GetCapacity();
            if( newCapacity <= oldCapacity )
                return;

            m_slots.resize( newCapacity );
            m_freeIndices.reserve( newCapacity );

            // Push in reverse so the lowest index is handed out first
            for( uint32_t i = newCapacity; i > oldCapacity; --i )
            {
                m_freeIndices.push_back( i - 1 );
            }

            if( oldCapacity > 0 )
            {
                HC_CORE_TRACE( "[ObjectPool] Grew from {} to {} slots", oldCapacity, newCapacity );
            }
        }

    private:
        std::vector<Slot>     m_slots;
        std::vector<uint32_t> m_freeIndices;
        uint32_t              m_maxCapacity    = 0;
        uint32_t              m_allocatedCount = 0;
    };
} // namespace Hypercube
