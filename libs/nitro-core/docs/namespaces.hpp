/**
@file
@brief Namespaces documentation.
*/

/**
@namespace bit
@brief Bitwise operations.

@namespace devlog
@brief Development logging utilities.

@namespace devlog::level
@brief Dev log levels.

@namespace nitro
@brief Nitro graphics register layer namespace.

@namespace nitro::mmio
@brief Memory-mapped I/O register addresses and volatile access primitives.

@namespace nitro::video
@brief 2D graphics engine registers, power control, master brightness and V-Count trigger.

@namespace nitro::video::detail
@brief Internal implementation details for register layouts.

@namespace nitro::video::dispcnt
@brief DISPCNT bit ranges shared by both engines.

@namespace nitro::video::grp
@brief Video development logging groups.

@namespace nitro::version
@brief Library version constants.
*/
