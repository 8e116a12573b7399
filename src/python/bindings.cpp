#include "Hypercube.h"
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>
#include <optional>

namespace nb = nanobind;

using namespace Hypercube;

// System handles cross the boundary as plain integers
namespace
{
    SystemHandle ToHandle( uint64_t raw )
    {
        return SystemHandle::FromValue( raw );
    }
} // namespace

void bind_types( nb::module_& m )
{
    nb::enum_<Result>( m, "Result" )
        .value( "SUCCESS", Result::SUCCESS )
        .value( "INVALID_ARGS", Result::INVALID_ARGS )
        .value( "OUT_OF_MEMORY", Result::OUT_OF_MEMORY );

    nb::enum_<LogLevel>( m, "LogLevel" )
        .value( "TRACE", LogLevel::TRACE )
        .value( "INFO", LogLevel::INFO )
        .value( "WARN", LogLevel::WARN )
        .value( "ERROR", LogLevel::ERROR )
        .value( "OFF", LogLevel::OFF );

    nb::class_<SystemConfig>( m, "SystemConfig" )
        .def( nb::init<>() )
        .def_rw( "viewport_size_percent", &SystemConfig::viewportSizePercent )
        .def_rw( "field_of_view_degrees", &SystemConfig::fieldOfViewDegrees )
        .def_rw( "max_simultaneous_spawns", &SystemConfig::maxSimultaneousSpawns )
        .def_rw( "min_group_delay", &SystemConfig::minGroupDelay )
        .def_rw( "max_group_delay", &SystemConfig::maxGroupDelay )
        .def_rw( "auto_replenish", &SystemConfig::autoReplenish )
        .def_rw( "min_active_objects", &SystemConfig::minActiveObjects )
        .def_rw( "fade_rate", &SystemConfig::fadeRate )
        .def_rw( "min_opacity", &SystemConfig::minOpacity )
        .def_rw( "min_scale", &SystemConfig::minScale )
        .def_rw( "particle_count", &SystemConfig::particleCount )
        .def_rw( "particle_field_radius", &SystemConfig::particleFieldRadius );

    nb::class_<HypercubeConfig>( m, "HypercubeConfig" )
        .def( nb::init<>() )
        .def_rw( "initial_pool_capacity", &HypercubeConfig::initialPoolCapacity )
        .def_rw( "max_pool_capacity", &HypercubeConfig::maxPoolCapacity )
        .def_rw( "max_delta_time", &HypercubeConfig::maxDeltaTime )
        .def_rw( "seed", &HypercubeConfig::seed )
        .def_rw( "log_level", &HypercubeConfig::logLevel )
        .def_rw( "default_system", &HypercubeConfig::defaultSystem );

    nb::class_<FrameSnapshot>( m, "FrameSnapshot" )
        .def_ro( "ids", &FrameSnapshot::ids )
        .def_ro( "positions", &FrameSnapshot::positions )
        .def_ro( "scales", &FrameSnapshot::scales )
        .def_ro( "rotations", &FrameSnapshot::rotations )
        .def_ro( "opacities", &FrameSnapshot::opacities )
        .def_ro( "colors", &FrameSnapshot::colors )
        .def_ro( "tail_lengths", &FrameSnapshot::tailLengths )
        .def_ro( "glow_intensities", &FrameSnapshot::glowIntensities )
        .def( "__len__", &FrameSnapshot::GetCount )
        .def( "__repr__", []( const FrameSnapshot& s ) { return "FrameSnapshot(count=" + std::to_string( s.GetCount() ) + ")"; } );

    nb::class_<ParticleSnapshot>( m, "ParticleSnapshot" )
        .def_ro( "positions", &ParticleSnapshot::positions )
        .def_ro( "sizes", &ParticleSnapshot::sizes )
        .def_ro( "colors", &ParticleSnapshot::colors )
        .def( "__len__", &ParticleSnapshot::GetCount )
        .def( "__repr__", []( const ParticleSnapshot& s ) { return "ParticleSnapshot(count=" + std::to_string( s.GetCount() ) + ")"; } );

    nb::class_<PoolStats>( m, "PoolStats" )
        .def_ro( "capacity", &PoolStats::capacity )
        .def_ro( "allocated", &PoolStats::allocated )
        .def_ro( "free", &PoolStats::free )
        .def_ro( "pending", &PoolStats::pending )
        .def_ro( "active", &PoolStats::active )
        .def_ro( "exiting", &PoolStats::exiting );
}

void bind_space_module( nb::module_& m )
{
    nb::class_<SpaceModule>( m, "SpaceModule" )
        .def( nb::init<>() )
        .def( "initialize", &SpaceModule::Initialize, nb::arg( "config" ) = HypercubeConfig() )
        .def( "shutdown", &SpaceModule::Shutdown )
        .def( "is_ready", &SpaceModule::IsReady )
        .def(
            "create_system",
            []( SpaceModule& self, float viewportSizePercent, float fovDegrees ) { return self.CreateSystem( viewportSizePercent, fovDegrees ).value; },
            nb::arg( "viewport_size_percent" ) = 25.0f, nb::arg( "fov_degrees" ) = 60.0f )
        .def(
            "create_system_with_config", []( SpaceModule& self, const SystemConfig& config ) { return self.CreateSystem( config ).value; },
            nb::arg( "config" ) )
        .def(
            "destroy_system", []( SpaceModule& self, uint64_t handle ) { return self.DestroySystem( ToHandle( handle ) ); }, nb::arg( "handle" ) )
        .def(
            "spawn", []( SpaceModule& self, uint64_t handle, uint32_t count ) { return self.Spawn( ToHandle( handle ), count ); },
            nb::arg( "handle" ), nb::arg( "count" ) )
        .def( "process_pending", &SpaceModule::ProcessPending, nb::arg( "dt" ) )
        .def(
            "update", []( SpaceModule& self, uint64_t handle, float dt ) { return self.Update( ToHandle( handle ), dt ); }, nb::arg( "handle" ),
            nb::arg( "dt" ) )
        .def(
            "get_visible",
            []( const SpaceModule& self, uint64_t handle ) -> std::optional<FrameSnapshot> {
                // Copy out: the native buffer is recycled two updates later
                const FrameSnapshot* snapshot = self.GetVisible( ToHandle( handle ) );
                if( !snapshot )
                    return std::nullopt;
                return *snapshot;
            },
            nb::arg( "handle" ) )
        .def(
            "get_particles",
            []( const SpaceModule& self, uint64_t handle ) -> std::optional<ParticleSnapshot> {
                const ParticleSnapshot* snapshot = self.GetParticles( ToHandle( handle ) );
                if( !snapshot )
                    return std::nullopt;
                return *snapshot;
            },
            nb::arg( "handle" ) )
        .def(
            "get_active_count", []( const SpaceModule& self, uint64_t handle ) { return self.GetActiveCount( ToHandle( handle ) ); },
            nb::arg( "handle" ) )
        .def(
            "get_pool_stats",
            []( const SpaceModule& self, uint64_t handle ) -> std::optional<PoolStats> {
                PoolStats stats;
                if( !self.GetPoolStats( ToHandle( handle ), stats ) )
                    return std::nullopt;
                return stats;
            },
            nb::arg( "handle" ) );
}

NB_MODULE( hypercube, m )
{
    m.doc() = "HYPERCUBE comet simulation core";

    bind_types( m );
    bind_space_module( m );
}
