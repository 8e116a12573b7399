#pragma once
#include <cstdint>
#include <functional>

namespace Hypercube
{
    /**
     * @brief Opaque reference into a slot table.
     * Packs a slot Index (low 32 bits) and a Generation (high 32 bits). A slot bumps its
     * generation whenever it is released, so handles taken before the release go stale.
     * Generation 0 is never issued: a zero value is always invalid.
     */
    struct Handle
    {
        uint64_t value = 0;

        Handle() = default;
        Handle( uint32_t index, uint32_t generation )
        {
            value = ( ( uint64_t )generation << 32 ) | index;
        }

        inline uint32_t GetIndex() const { return ( uint32_t )( value & 0xFFFFFFFF ); }
        inline uint32_t GetGeneration() const { return ( uint32_t )( value >> 32 ); }
        inline bool     IsValid() const { return GetGeneration() != 0; }

        explicit operator bool() const { return IsValid(); }

        inline bool operator==( const Handle& other ) const { return value == other.value; }
        inline bool operator!=( const Handle& other ) const { return value != other.value; }
        inline bool operator<( const Handle& other ) const { return value < other.value; }
    };

} // namespace Hypercube

namespace std
{
    template<>
    struct hash<Hypercube::Handle>
    {
        size_t operator()( const Hypercube::Handle& h ) const { return hash<uint64_t>()( h.value ); }
    };
} // namespace std

/**
 * @brief Defines a strongly typed handle derived from Handle.
 * FromValue() rebuilds a handle from the raw integer a host passed across the boundary.
 */
#define DEFINE_HANDLE( Name )                                                                                                                        \
    struct Name : public ::Hypercube::Handle                                                                                                         \
    {                                                                                                                                                \
        using Handle::Handle;                                                                                                                        \
        static const Name Invalid;                                                                                                                   \
        static Name       FromValue( uint64_t raw )                                                                                                  \
        {                                                                                                                                            \
            Name h;                                                                                                                                  \
            h.value = raw;                                                                                                                           \
            return h;                                                                                                                                \
        }                                                                                                                                            \
    };                                                                                                                                               \
    inline const Name Name::Invalid = Name( 0, 0 )

