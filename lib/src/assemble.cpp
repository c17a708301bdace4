#include <sstream>
#include <string>
#include <utility>

#include <dmi/assemble.hpp>

namespace dmi {

namespace {

std::string str( const keyvalue& x ) {
    std::ostringstream stream;
    kv::operator<<( stream, x );
    return stream.str();
}

template< typename T >
T required( const boost::optional< T >& x, key k ) {
    if( !x )
        throw error( std::string( "Required field `" ) + name( k )
                   + "` was not found" );
    return *x;
}

/*
 * The fold visitors have one overload per property the block accepts. The
 * template catches everything else, which is an error - a width in a state,
 * a second state = line indented as a property and so on.
 */
struct fold_header : boost::static_visitor< void > {
    void operator()( const kv::width& x )  { this->width = x.val; }
    void operator()( const kv::height& x ) { this->height = x.val; }

    void operator()( const kv::unknown& x ) {
        this->unknown[ x.name ] = x.val;
    }

    template< typename T >
    void operator()( const T& x ) const {
        throw error( "`" + str( x ) + "` not allowed in header" );
    }

    boost::optional< std::uint32_t > width;
    boost::optional< std::uint32_t > height;
    unknowns unknown;
};

struct fold_state : boost::static_visitor< void > {
    explicit fold_state( state& s ) : st( s ) {}

    void operator()( const kv::dirs& x )     { this->dirs = x.val; }
    void operator()( const kv::frames& x )   { this->st.frames = x.val; }
    void operator()( const kv::delay& x )    { this->st.delays = x.val; }
    void operator()( const kv::loop& x )     { this->st.loop = x.val; }
    void operator()( const kv::rewind& x )   { this->st.rewind = x.val; }
    void operator()( const kv::movement& x ) { this->st.movement = x.val; }

    void operator()( const kv::hotspot& x ) {
        if( x.val.size() != 3 )
            throw error( "Hotspot information was not length 3, was "
                       + std::to_string( x.val.size() ) );

        this->st.hotspot = std::array< double, 3 >{{
            x.val[ 0 ], x.val[ 1 ], x.val[ 2 ]
        }};
    }

    void operator()( const kv::unknown& x ) {
        this->st.unknown[ x.name ] = x.val;
    }

    template< typename T >
    void operator()( const T& x ) const {
        throw error( "`" + str( x ) + "` not allowed in state" );
    }

    state& st;
    boost::optional< dmi::dirs > dirs;
};

}

header make_header( const block& blk ) {
    const auto version = boost::get< kv::version >( blk.intro ).val;

    if( version != 4.0 ) {
        std::ostringstream msg;
        msg << "Version " << version << " not supported, only 4.0";
        throw error( msg.str() );
    }

    fold_header fold;
    for( const auto& x : blk.properties )
        boost::apply_visitor( fold, x );

    header h;
    h.version = version;
    h.width   = required( fold.width,  key::width );
    h.height  = required( fold.height, key::height );
    h.unknown = std::move( fold.unknown );
    return h;
}

state make_state( const block& blk ) {
    state s;
    s.name = boost::get< kv::state >( blk.intro ).val;

    fold_state fold( s );
    for( const auto& x : blk.properties )
        boost::apply_visitor( fold, x );

    s.dirs = required( fold.dirs, key::dirs );
    return s;
}

}
