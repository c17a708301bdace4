#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <boost/spirit/include/qi.hpp>

#include <dmi/assemble.hpp>
#include <dmi/parser.hpp>

namespace qi    = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;

namespace dmi {

namespace {

template< typename T >
struct decimal_policies : qi::real_policies< T > {
    // nan and inf are words, not numbers, in a metadata block
    template< typename It, typename Attr >
    static bool parse_nan( It&, const It&, Attr& ) { return false; }

    template< typename It, typename Attr >
    static bool parse_inf( It&, const It&, Attr& ) { return false; }
};

qi::real_parser< double, decimal_policies< double > > decimal;
qi::int_parser< std::int64_t > int64;

/*
 * A list is only a list if there is a comma in it. A lone number is an int,
 * unless it carries a fraction or an exponent, so 32 and 32.0 are distinct
 * values and a key can insist on one of them. Every list element is a
 * decimal, which makes 1,2,5.4,3 a list of four doubles.
 */
template< typename Itr >
struct grammar {
    grammar() {
        str     = '"' >> *~qi::char_( "\"\n" ) >> '"';
        number  = decimal;
        list    = number >> +( ',' >> number );
        integer = int64 >> !qi::char_( ".eE" );
        atom    = str | list | integer | number;
        name    = +ascii::alpha;

        str.name( "string" );
        number.name( "decimal" );
        list.name( "list" );
        integer.name( "integer" );
        atom.name( "value" );
        name.name( "key" );
    }

    qi::rule< Itr, std::string() >           str;
    qi::rule< Itr, double() >                number;
    qi::rule< Itr, std::vector< double >() > list;
    qi::rule< Itr, std::int64_t() >          integer;
    qi::rule< Itr, value::type() >           atom;
    qi::rule< Itr, std::string() >           name;
};

using itr = const char*;

std::string fragment( itr fst, itr lst ) {
    return std::string( fst, std::find( fst, lst, '\n' ) );
}

std::string str( const value& x ) {
    std::ostringstream stream;
    stream << x;
    return stream.str();
}

struct keys : qi::symbols< char, key > {
    keys() {
        this->add
            ( "version",  key::version )
            ( "width",    key::width )
            ( "height",   key::height )
            ( "state",    key::state )
            ( "dirs",     key::dirs )
            ( "frames",   key::frames )
            ( "delay",    key::delay )
            ( "loop",     key::loop )
            ( "rewind",   key::rewind )
            ( "movement", key::movement )
            ( "hotspot",  key::hotspot )
        ;
    }
};

key lookup( const std::string& name ) {
    static const keys table;
    const auto* k = table.find( name );
    return k ? *k : key::unknown;
}

template< typename T >
const T& expect( key k, const value& x ) {
    const auto* v = boost::get< T >( &x.val );
    if( v ) return *v;

    throw error( std::string( "Unable to validate key -> value pair `" )
               + name( k ) + " -> " + str( x ) + "`" );
}

std::uint32_t uint32( key k, const value& x ) {
    const auto v = expect< std::int64_t >( k, x );
    if( v >= 0 && v <= std::numeric_limits< std::uint32_t >::max() )
        return static_cast< std::uint32_t >( v );

    throw error( "Value " + std::to_string( v ) + " out of range for `"
               + name( k ) + "`" );
}

keyvalue coerce( std::string id, value x ) {
    const auto k = lookup( id );

    switch( k ) {
        case key::version:  return kv::version{ expect< double >( k, x ) };
        case key::width:    return kv::width{ uint32( k, x ) };
        case key::height:   return kv::height{ uint32( k, x ) };
        case key::state:    return kv::state{ expect< std::string >( k, x ) };
        case key::dirs:
            return kv::dirs{ to_dirs( expect< std::int64_t >( k, x ) ) };
        case key::frames:   return kv::frames{ uint32( k, x ) };
        case key::delay:
            return kv::delay{ expect< std::vector< double > >( k, x ) };
        case key::loop:     return kv::loop{ uint32( k, x ) };
        case key::rewind:   return kv::rewind{ uint32( k, x ) };
        case key::movement: return kv::movement{ uint32( k, x ) };
        case key::hotspot:
            return kv::hotspot{ expect< std::vector< double > >( k, x ) };
        case key::unknown:
            return kv::unknown{ std::move( id ), std::move( x ) };
    }

    throw std::runtime_error( "wrong key tag!" );
}

value atom( const grammar< itr >& g, itr& fst, itr lst ) {
    value x;
    if( !qi::parse( fst, lst, g.atom, x.val ) )
        throw error( "Expected value, got '" + fragment( fst, lst ) + "'" );

    return x;
}

keyvalue key_value( const grammar< itr >& g, itr& fst, itr lst ) {
    auto cur = fst;

    std::string id;
    if( !qi::parse( cur, lst, g.name, id ) )
        throw error( "Expected key, got '" + fragment( cur, lst ) + "'" );

    if( !qi::parse( cur, lst, qi::lit( " = " ) ) )
        throw error( "Expected ' = ' after `" + id + "`, got '"
                   + fragment( cur, lst ) + "'" );

    auto x = atom( g, cur, lst );
    auto prop = coerce( std::move( id ), std::move( x ) );
    fst = cur;
    return prop;
}

/*
 * key = value and its newline. Nothing but the newline may follow the value,
 * so trailing spaces and \r are rejected here.
 */
keyvalue line( const grammar< itr >& g, itr& fst, itr lst ) {
    auto cur = fst;
    auto prop = key_value( g, cur, lst );

    if( !qi::parse( cur, lst, qi::lit( '\n' ) ) ) {
        std::ostringstream msg;
        msg << "Expected end of line after `";
        kv::operator<<( msg, prop ) << "`, got '" << fragment( cur, lst ) << "'";
        throw error( msg.str() );
    }

    fst = cur;
    return prop;
}

/*
 * Read the introducer line and then properties for as long as the next line
 * is indented. fst is advanced one line at a time, so when this throws it
 * points to the start of the offending line.
 */
block read_block( const grammar< itr >& g, itr& fst, itr lst, key intro ) {
    auto cur = fst;
    auto head = line( g, cur, lst );

    if( which( head ) != intro ) {
        std::ostringstream msg;
        msg << "Expected `" << intro << " = ` block, got `";
        kv::operator<<( msg, head ) << "`";
        throw error( msg.str() );
    }

    fst = cur;
    block blk{ std::move( head ), {} };

    while( qi::parse( cur, lst, +ascii::blank ) ) {
        blk.properties.push_back( line( g, cur, lst ) );
        fst = cur;
    }

    if( blk.properties.empty() ) {
        std::ostringstream msg;
        msg << "`" << intro << "` block requires at least one property, got '"
            << fragment( fst, lst ) << "'";
        throw error( msg.str() );
    }

    return blk;
}

int lineno( itr begin, itr pos ) {
    return 1 + static_cast< int >( std::count( begin, pos, '\n' ) );
}

}

value atom( const char*& fst, const char* lst ) {
    const grammar< itr > g;
    return atom( g, fst, lst );
}

keyvalue key_value( const char*& fst, const char* lst ) {
    const grammar< itr > g;
    return key_value( g, fst, lst );
}

header read_header( const char*& fst, const char* lst ) {
    const grammar< itr > g;
    auto cur = fst;
    auto h = make_header( read_block( g, cur, lst, key::version ) );
    fst = cur;
    return h;
}

state read_state( const char*& fst, const char* lst ) {
    const grammar< itr > g;
    auto cur = fst;
    auto s = make_state( read_block( g, cur, lst, key::state ) );
    fst = cur;
    return s;
}

metadata parse( const char* fst, const char* lst ) {
    const grammar< itr > g;
    const auto begin = fst;

    /*
     * cur always points to the start of the line being read. Blocks are
     * validated after all their lines are read, and validation errors are
     * reported at the introducer line, so cur is moved back to it.
     */
    auto cur = fst;

    const auto assemble = [&]( key intro, auto make ) {
        const auto start = cur;
        auto blk = read_block( g, cur, lst, intro );
        const auto end = cur;
        cur = start;
        auto record = make( blk );
        cur = end;
        return record;
    };

    try {
        if( !qi::parse( cur, lst, qi::lit( "# BEGIN DMI" ) >> '\n' ) )
            throw error( "Expected '# BEGIN DMI', got '"
                       + fragment( cur, lst ) + "'" );

        metadata m;
        m.header = assemble( key::version, make_header );

        for( ;; ) {
            if( cur == lst )
                throw error( "Expected '# END DMI', got end of input" );

            auto peek = cur;
            if( qi::parse( peek, lst, qi::lit( "# END DMI" ) ) ) break;

            m.states.push_back( assemble( key::state, make_state ) );
        }

        if( !qi::parse( cur, lst, "# END DMI" >> *ascii::space ) || cur != lst )
            throw error( "Unexpected trailing input after '# END DMI': '"
                       + fragment( cur, lst ) + "'" );

        return m;
    } catch( const error& e ) {
        throw error( "line " + std::to_string( lineno( begin, cur ) )
                   + ": " + e.what() );
    }
}

metadata parse( const std::string& input ) {
    return parse( input.data(), input.data() + input.size() );
}

}
