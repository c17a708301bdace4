#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <dmi/parser.hpp>

#include <catch2/catch.hpp>

using namespace std::string_literals;

namespace {

/*
 * key_value must consume the complete input for these tests, so that
 * partial matches such as width = 32.5 -> 32 are not mistaken for success
 */
dmi::keyvalue parse_kv( const std::string& input ) {
    const char* fst = input.data();
    const char* lst = input.data() + input.size();
    auto x = dmi::key_value( fst, lst );

    if( fst != lst )
        throw std::logic_error( "unconsumed input: " + std::string( fst, lst ) );

    return x;
}

dmi::keyvalue kv( dmi::keyvalue x ) {
    return x;
}

}

SCENARIO( "unsigned integer properties", "[kv][int]" ) {
    const std::vector< std::uint32_t > values = {
        0, 1, 2, 32, 480, 65535, 4294967295u,
    };

    GIVEN( "valid non-negative integers" ) {
        THEN( "each integer key gets its own property" ) {
            for( const auto n : values ) {
                const auto num = std::to_string( n );
                INFO( "n = " << num );

                CHECK( parse_kv( "width = "    + num ) == kv( dmi::kv::width{ n } ) );
                CHECK( parse_kv( "height = "   + num ) == kv( dmi::kv::height{ n } ) );
                CHECK( parse_kv( "frames = "   + num ) == kv( dmi::kv::frames{ n } ) );
                CHECK( parse_kv( "loop = "     + num ) == kv( dmi::kv::loop{ n } ) );
                CHECK( parse_kv( "rewind = "   + num ) == kv( dmi::kv::rewind{ n } ) );
                CHECK( parse_kv( "movement = " + num ) == kv( dmi::kv::movement{ n } ) );
            }
        }
    }

    GIVEN( "integers that do not fit" ) {
        THEN( "negative numbers are rejected" ) {
            CHECK_THROWS_AS( parse_kv( "width = -1" ), dmi::error );
            CHECK_THROWS_AS( parse_kv( "frames = -10" ), dmi::error );
        }

        THEN( "numbers larger than 32 bits are rejected" ) {
            CHECK_THROWS_AS( parse_kv( "height = 4294967296" ), dmi::error );
        }
    }

    GIVEN( "values of the wrong shape" ) {
        THEN( "decimals are rejected" ) {
            CHECK_THROWS_AS( parse_kv( "width = 32.0" ), dmi::error );
            CHECK_THROWS_AS( parse_kv( "loop = 1e0" ), dmi::error );
        }

        THEN( "strings are rejected" ) {
            CHECK_THROWS_AS( parse_kv( R"(height = "32")" ), dmi::error );
        }

        THEN( "lists are rejected" ) {
            CHECK_THROWS_AS( parse_kv( "frames = 1,2" ), dmi::error );
        }
    }
}

TEST_CASE( "version", "[kv][version]" ) {
    CHECK( parse_kv( "version = 4.0" ) == kv( dmi::kv::version{ 4.0 } ) );
    CHECK( parse_kv( "version = 3.5" ) == kv( dmi::kv::version{ 3.5 } ) );

    SECTION( "an integer version has the wrong shape" ) {
        CHECK_THROWS_AS( parse_kv( "version = 4" ), dmi::error );
    }
}

TEST_CASE( "state", "[kv][state]" ) {
    CHECK( parse_kv( R"(state = "meow")" ) == kv( dmi::kv::state{ "meow" } ) );
    CHECK( parse_kv( R"(state = "")" ) == kv( dmi::kv::state{ "" } ) );
    CHECK( parse_kv( R"(state = "open door 2")" )
        == kv( dmi::kv::state{ "open door 2" } ) );

    SECTION( "only strings are names" ) {
        CHECK_THROWS_AS( parse_kv( "state = 4" ), dmi::error );
        CHECK_THROWS_AS( parse_kv( "state = meow" ), dmi::error );
    }
}

TEST_CASE( "dirs", "[kv][dirs]" ) {
    CHECK( parse_kv( "dirs = 1" ) == kv( dmi::kv::dirs{ dmi::dirs::one } ) );
    CHECK( parse_kv( "dirs = 4" ) == kv( dmi::kv::dirs{ dmi::dirs::four } ) );
    CHECK( parse_kv( "dirs = 8" ) == kv( dmi::kv::dirs{ dmi::dirs::eight } ) );

    SECTION( "other direction counts fail validation" ) {
        CHECK_THROWS_AS( parse_kv( "dirs = 0" ), dmi::error );
        CHECK_THROWS_AS( parse_kv( "dirs = 2" ), dmi::error );
        CHECK_THROWS_AS( parse_kv( "dirs = 16" ), dmi::error );
        CHECK_THROWS_AS( parse_kv( "dirs = -4" ), dmi::error );
        CHECK_THROWS_WITH( parse_kv( "dirs = 2" ),
                           Catch::Contains( "Invalid value 2 for dirs" ) );
    }

    SECTION( "dirs must be an integer" ) {
        CHECK_THROWS_AS( parse_kv( "dirs = 4.0" ), dmi::error );
    }
}

TEST_CASE( "direction counts convert to integers", "[dirs]" ) {
    CHECK( dmi::count( dmi::dirs::one )   == 1 );
    CHECK( dmi::count( dmi::dirs::four )  == 4 );
    CHECK( dmi::count( dmi::dirs::eight ) == 8 );

    CHECK( dmi::to_dirs( 4 ) == dmi::dirs::four );
    CHECK_THROWS_AS( dmi::to_dirs( 3 ), dmi::error );
}

TEST_CASE( "delay", "[kv][delay]" ) {
    SECTION( "integer delays" ) {
        const auto expected = std::vector< double >{ 1.0, 2.0, 3.0 };
        CHECK( parse_kv( "delay = 1,2,3" ) == kv( dmi::kv::delay{ expected } ) );
    }

    SECTION( "mixed integer and decimal delays" ) {
        const auto expected = std::vector< double >{ 1.0, 2.0, 5.4, 3.0 };
        CHECK( parse_kv( "delay = 1,2,5.4,3" )
            == kv( dmi::kv::delay{ expected } ) );
    }

    SECTION( "a single number is not a list" ) {
        CHECK_THROWS_AS( parse_kv( "delay = 1" ), dmi::error );
        CHECK_THROWS_AS( parse_kv( "delay = 1.5" ), dmi::error );
    }

    SECTION( "a trailing comma is not consumed" ) {
        CHECK_THROWS_AS( parse_kv( "delay = 1,2," ), std::logic_error );
    }
}

TEST_CASE( "hotspot", "[kv][hotspot]" ) {
    const auto expected = std::vector< double >{ 13.0, 12.0, 1.0 };
    CHECK( parse_kv( "hotspot = 13,12,1" ) == kv( dmi::kv::hotspot{ expected } ) );

    SECTION( "any length is accepted here" ) {
        const auto two  = std::vector< double >{ 13.0, 12.0 };
        const auto four = std::vector< double >{ 13.0, 12.0, 1.0, 0.0 };
        CHECK( parse_kv( "hotspot = 13,12" ) == kv( dmi::kv::hotspot{ two } ) );
        CHECK( parse_kv( "hotspot = 13,12,1,0" )
            == kv( dmi::kv::hotspot{ four } ) );
    }
}

TEST_CASE( "unknown keys are kept with their raw value", "[kv][unknown]" ) {
    SECTION( "string" ) {
        const auto x = parse_kv( R"(future = "lmao")" );
        CHECK( dmi::which( x ) == dmi::key::unknown );
        CHECK( x == kv( dmi::kv::unknown{ "future", { "lmao"s } } ) );
    }

    SECTION( "integer" ) {
        const auto x = parse_kv( "future = 3" );
        CHECK( x == kv( dmi::kv::unknown{ "future", { std::int64_t( 3 ) } } ) );
    }

    SECTION( "decimal" ) {
        const auto x = parse_kv( "future = 3.5" );
        CHECK( x == kv( dmi::kv::unknown{ "future", { 3.5 } } ) );
    }

    SECTION( "list" ) {
        const auto xs = std::vector< double >{ 1.0, 2.0 };
        const auto x = parse_kv( "future = 1,2" );
        CHECK( x == kv( dmi::kv::unknown{ "future", { xs } } ) );
    }

    SECTION( "keys are case sensitive" ) {
        const auto x = parse_kv( "Width = 32" );
        CHECK( dmi::which( x ) == dmi::key::unknown );
        CHECK( x == kv( dmi::kv::unknown{ "Width", { std::int64_t( 32 ) } } ) );
    }
}

TEST_CASE( "the separator is exactly ' = '", "[kv]" ) {
    CHECK_THROWS_AS( parse_kv( "width=32" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "width =32" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "width= 32" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "width  = 32" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "width =  32" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "width\t= 32" ), dmi::error );
    CHECK_THROWS_WITH( parse_kv( "width=32" ), Catch::Contains( "' = '" ) );
}

TEST_CASE( "keys are alphabetic", "[kv]" ) {
    CHECK_THROWS_AS( parse_kv( "future_key = 1" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "2x = 1" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( " = 1" ), dmi::error );
    CHECK_THROWS_AS( parse_kv( "" ), dmi::error );
}

TEST_CASE( "mismatches name the key and the value", "[kv]" ) {
    using Catch::Contains;

    CHECK_THROWS_WITH( parse_kv( "state = 4" ),
                       Contains( "state" ) && Contains( "4" ) );
    CHECK_THROWS_WITH( parse_kv( R"(width = "wide")" ),
                       Contains( "width" ) && Contains( "\"wide\"" ) );
}

TEST_CASE( "a failed key-value does not move the cursor", "[kv]" ) {
    const std::string input = "width = 32.5";
    const char* fst = input.data();
    const char* lst = input.data() + input.size();

    CHECK_THROWS_AS( dmi::key_value( fst, lst ), dmi::error );
    CHECK( fst == input.data() );
}

TEST_CASE( "key-values print as their line", "[kv][print]" ) {
    const auto str = []( const dmi::keyvalue& x ) {
        std::ostringstream stream;
        stream << x;
        return stream.str();
    };

    CHECK( str( parse_kv( "dirs = 4" ) ) == "dirs = 4" );
    CHECK( str( parse_kv( "version = 4.0" ) ) == "version = 4.0" );
    CHECK( str( parse_kv( R"(state = "meow")" ) ) == R"(state = "meow")" );
    CHECK( str( parse_kv( "delay = 1.2,1" ) ) == "delay = 1.2,1" );
    CHECK( str( parse_kv( R"(future = "lmao")" ) ) == R"(future = "lmao")" );
}
