#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

#include <dmi/metadata.hpp>

namespace dmi {

value::tag value::which() const {
    switch( this->val.which() ) {
        case 0: return tag::Int;
        case 1: return tag::Float;
        case 2: return tag::Str;
        case 3: return tag::List;

        default:
            throw std::runtime_error( "wrong type tag!" );
    }
}

const char* name( key k ) {
    switch( k ) {
        case key::version:  return "version";
        case key::width:    return "width";
        case key::height:   return "height";
        case key::state:    return "state";
        case key::dirs:     return "dirs";
        case key::frames:   return "frames";
        case key::delay:    return "delay";
        case key::loop:     return "loop";
        case key::rewind:   return "rewind";
        case key::movement: return "movement";
        case key::hotspot:  return "hotspot";
        case key::unknown:  return "unknown";
    }

    throw std::runtime_error( "wrong key tag!" );
}

int count( dirs d ) {
    return static_cast< int >( d );
}

dirs to_dirs( std::int64_t x ) {
    switch( x ) {
        case 1: return dirs::one;
        case 4: return dirs::four;
        case 8: return dirs::eight;

        default:
            throw error( "Invalid value " + std::to_string( x ) + " for dirs" );
    }
}

namespace {

struct keyof : boost::static_visitor< key > {
    template< key K, typename T >
    key operator()( const kv::property< K, T >& ) const { return K; }
    key operator()( const kv::unknown& ) const { return key::unknown; }
};

std::string shortest( double x ) {
    std::ostringstream ss;
    ss.precision( std::numeric_limits< double >::digits10 );
    ss << x;

    if( std::strtod( ss.str().c_str(), nullptr ) == x )
        return ss.str();

    ss.str( "" );
    ss.precision( std::numeric_limits< double >::max_digits10 );
    ss << x;
    return ss.str();
}

/*
 * a scalar decimal always carries a '.' or an exponent, otherwise reading it
 * back would give an integer
 */
std::ostream& decimal( std::ostream& stream, double x, bool point ) {
    auto str = shortest( x );
    if( point && str.find_first_of( ".eEn" ) == std::string::npos )
        str += ".0";

    return stream << str;
}

template< typename Seq >
std::ostream& join( std::ostream& stream, const Seq& xs ) {
    auto first = true;
    for( const auto& x : xs ) {
        if( !first ) stream << ",";
        decimal( stream, x, false );
        first = false;
    }
    return stream;
}

struct print : boost::static_visitor< void > {
    explicit print( std::ostream& s ) : stream( s ) {}

    void operator()( std::int64_t x ) const           { stream << x; }
    void operator()( double x ) const                 { decimal( stream, x, true ); }
    void operator()( const std::string& x ) const     { stream << '"' << x << '"'; }
    void operator()( const std::vector< double >& x ) const { join( stream, x ); }
    void operator()( dirs x ) const                   { stream << x; }
    void operator()( std::uint32_t x ) const          { stream << x; }
    void operator()( const value& x ) const           { stream << x; }

    template< key K, typename T >
    void operator()( const kv::property< K, T >& x ) const {
        stream << K << " = ";
        (*this)( x.val );
    }

    void operator()( const kv::unknown& x ) const {
        stream << x.name << " = " << x.val;
    }

    std::ostream& stream;
};

/*
 * optional fields are only printed when present
 */
template< typename T >
void field( std::ostream& stream, key k, const boost::optional< T >& x ) {
    if( !x ) return;
    stream << "\n    " << k << " = ";
    join( stream, std::vector< double >( x->begin(), x->end() ) );
}

void field( std::ostream& stream, key k,
            const boost::optional< std::uint32_t >& x ) {
    if( !x ) return;
    stream << "\n    " << k << " = " << *x;
}

void unknown( std::ostream& stream, const unknowns& xs ) {
    for( const auto& x : xs )
        stream << "\n    " << x.first << " = " << x.second;
}

}

key which( const keyvalue& x ) {
    return boost::apply_visitor( keyof(), x );
}

namespace kv {

bool operator==( const unknown& lhs, const unknown& rhs ) {
    return lhs.name == rhs.name && lhs.val == rhs.val;
}

std::ostream& operator<<( std::ostream& stream, const keyvalue& x ) {
    boost::apply_visitor( print( stream ), x );
    return stream;
}

}

bool operator==( const value& lhs, const value& rhs ) {
    return lhs.val == rhs.val;
}

bool operator!=( const value& lhs, const value& rhs ) {
    return !( lhs == rhs );
}

bool operator==( const header& lhs, const header& rhs ) {
    return lhs.version == rhs.version
        && lhs.width   == rhs.width
        && lhs.height  == rhs.height
        && lhs.unknown == rhs.unknown
        ;
}

bool operator!=( const header& lhs, const header& rhs ) {
    return !( lhs == rhs );
}

bool operator==( const state& lhs, const state& rhs ) {
    return lhs.name     == rhs.name
        && lhs.dirs     == rhs.dirs
        && lhs.frames   == rhs.frames
        && lhs.delays   == rhs.delays
        && lhs.loop     == rhs.loop
        && lhs.rewind   == rhs.rewind
        && lhs.movement == rhs.movement
        && lhs.hotspot  == rhs.hotspot
        && lhs.unknown  == rhs.unknown
        ;
}

bool operator!=( const state& lhs, const state& rhs ) {
    return !( lhs == rhs );
}

bool operator==( const metadata& lhs, const metadata& rhs ) {
    return lhs.header == rhs.header
        && lhs.states.size() == rhs.states.size()
        && std::equal( lhs.states.begin(), lhs.states.end(),
                       rhs.states.begin() );
}

bool operator!=( const metadata& lhs, const metadata& rhs ) {
    return !( lhs == rhs );
}

std::ostream& operator<<( std::ostream& stream, const value& x ) {
    boost::apply_visitor( print( stream ), x.val );
    return stream;
}

std::ostream& operator<<( std::ostream& stream, key k ) {
    return stream << name( k );
}

std::ostream& operator<<( std::ostream& stream, dirs d ) {
    return stream << count( d );
}

std::ostream& operator<<( std::ostream& stream, const header& h ) {
    stream << "version = ";
    decimal( stream, h.version, true )
           << "\n    width = " << h.width
           << "\n    height = " << h.height;
    unknown( stream, h.unknown );
    return stream;
}

std::ostream& operator<<( std::ostream& stream, const state& s ) {
    stream << "state = \"" << s.name << "\""
           << "\n    dirs = " << s.dirs
           << "\n    frames = " << s.frames;

    field( stream, key::delay,    s.delays );
    field( stream, key::loop,     s.loop );
    field( stream, key::rewind,   s.rewind );
    field( stream, key::movement, s.movement );
    field( stream, key::hotspot,  s.hotspot );
    unknown( stream, s.unknown );
    return stream;
}

std::ostream& operator<<( std::ostream& stream, const metadata& m ) {
    stream << "# BEGIN DMI\n" << m.header << "\n";
    for( const auto& s : m.states )
        stream << s << "\n";
    return stream << "# END DMI\n";
}

}
