#ifndef DMI_PARSER_HPP
#define DMI_PARSER_HPP

#include <string>
#include <vector>

#include <dmi/metadata.hpp>

namespace dmi {

/*
 * The building blocks of the document grammar. All of them parse from the
 * front of [fst, lst), advance fst past what they consumed and throw
 * dmi::error if the input does not match.
 *
 * atom       - one literal: "string", integer, decimal or decimal,decimal,..
 * key_value  - key = value, no line terminator, value coerced to the key
 * read_*     - an introducer line and its indented property lines, including
 *              the trailing newline of each
 */
value     atom( const char*& fst, const char* lst );
keyvalue  key_value( const char*& fst, const char* lst );
header    read_header( const char*& fst, const char* lst );
state     read_state( const char*& fst, const char* lst );

/*
 * Parse a complete metadata document, from # BEGIN DMI to # END DMI. The
 * entire input must be consumed, save for trailing whitespace.
 */
metadata parse( const char* fst, const char* lst );
metadata parse( const std::string& );

/*
 * Read a file with extracted metadata text and parse it
 */
metadata load( const std::string& path );

}

#endif // DMI_PARSER_HPP
