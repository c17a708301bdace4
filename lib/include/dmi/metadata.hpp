#ifndef DMI_METADATA_HPP
#define DMI_METADATA_HPP

#include <array>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace dmi {

class error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

/*
 * The right-hand side of a key = value line, before it is matched against
 * the key. Only unknown keys keep it in this form.
 */
struct value {
    using type = boost::variant< std::int64_t,
                                 double,
                                 std::string,
                                 std::vector< double >
                               >;
    enum class tag { Int, Float, Str, List };

    tag which() const;

    type val;
};

enum class key {
    version,
    width,
    height,
    state,
    dirs,
    frames,
    delay,
    loop,
    rewind,
    movement,
    hotspot,
    unknown,
};

const char* name( key );

enum class dirs : std::uint8_t { one = 1, four = 4, eight = 8 };

int count( dirs );
dirs to_dirs( std::int64_t );

namespace kv {

template< key K, typename T >
struct property {
    T val;
};

template< key K, typename T >
bool operator==( const property< K, T >& lhs, const property< K, T >& rhs ) {
    return lhs.val == rhs.val;
}

using version  = property< key::version,  double >;
using width    = property< key::width,    std::uint32_t >;
using height   = property< key::height,   std::uint32_t >;
using state    = property< key::state,    std::string >;
using dirs     = property< key::dirs,     dmi::dirs >;
using frames   = property< key::frames,   std::uint32_t >;
using delay    = property< key::delay,    std::vector< double > >;
using loop     = property< key::loop,     std::uint32_t >;
using rewind   = property< key::rewind,   std::uint32_t >;
using movement = property< key::movement, std::uint32_t >;
using hotspot  = property< key::hotspot,  std::vector< double > >;

struct unknown {
    std::string name;
    value val;
};

bool operator==( const unknown&, const unknown& );

}

using keyvalue = boost::variant< kv::version,
                                 kv::width,
                                 kv::height,
                                 kv::state,
                                 kv::dirs,
                                 kv::frames,
                                 kv::delay,
                                 kv::loop,
                                 kv::rewind,
                                 kv::movement,
                                 kv::hotspot,
                                 kv::unknown
                               >;

key which( const keyvalue& );

using unknowns = std::map< std::string, value >;

struct header {
    double version;
    std::uint32_t width;
    std::uint32_t height;
    unknowns unknown;
};

struct state {
    std::string name;
    dmi::dirs dirs;
    std::uint32_t frames = 1;
    boost::optional< std::vector< double > > delays;
    boost::optional< std::uint32_t > loop;
    boost::optional< std::uint32_t > rewind;
    boost::optional< std::uint32_t > movement;
    boost::optional< std::array< double, 3 > > hotspot;
    unknowns unknown;
};

struct metadata {
    dmi::header header;
    std::vector< dmi::state > states;
};

bool operator==( const value&, const value& );
bool operator!=( const value&, const value& );
bool operator==( const header&, const header& );
bool operator!=( const header&, const header& );
bool operator==( const state&, const state& );
bool operator!=( const state&, const state& );
bool operator==( const metadata&, const metadata& );
bool operator!=( const metadata&, const metadata& );

std::ostream& operator<<( std::ostream&, const value& );
std::ostream& operator<<( std::ostream&, key );
std::ostream& operator<<( std::ostream&, dirs );
std::ostream& operator<<( std::ostream&, const header& );
std::ostream& operator<<( std::ostream&, const state& );
std::ostream& operator<<( std::ostream&, const metadata& );

namespace kv {
/*
 * keyvalue is a boost::variant, so argument-dependent lookup only sees this
 * namespace (through the alternatives) and boost. Declaring it here keeps it
 * in front of the generic boost::variant operator<<.
 */
std::ostream& operator<<( std::ostream&, const keyvalue& );
}

}

#endif // DMI_METADATA_HPP
