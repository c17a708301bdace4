#ifndef DMI_ASSEMBLE_HPP
#define DMI_ASSEMBLE_HPP

#include <vector>

#include <dmi/metadata.hpp>

namespace dmi {

/*
 * One introducer line (version = or state =) and the indented property lines
 * that follow it, as recognised by the grammar and before any validation
 * beyond per-key typing.
 */
struct block {
    keyvalue intro;
    std::vector< keyvalue > properties;
};

/*
 * Fold the block into a record, left to right. A later property overwrites
 * an earlier one, unknown keys are collected by name. Throws dmi::error if a
 * property is not allowed in the block, or a required one is missing.
 */
header make_header( const block& );
state  make_state( const block& );

}

#endif // DMI_ASSEMBLE_HPP
