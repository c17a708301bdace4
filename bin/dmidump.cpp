#include <cstring>
#include <ios>
#include <iostream>
#include <sstream>
#include <string>

#include <dmi/parser.hpp>

namespace {

std::string escape( const std::string& label ) {
    std::string out;
    for( const auto c : label ) {
        if( c == '"' ) out += '\\';
        out += c;
    }
    return out;
}

std::ostream& property( std::ostream& stream,
                        const std::string& node,
                        int index,
                        const std::string& label ) {
    return stream << "\t\t"
                  << node << "_" << index
                  << "[shape=record, label=\"" << escape( label ) << "\"]\n"
                  << "\t" << node << " -- " << node << "_" << index << "\n";
}

template< typename T >
std::string str( const T& x ) {
    std::ostringstream stream;
    stream << x;
    return stream.str();
}

/*
 * One node for the header and each state, hung off a root node. Every
 * property is a record-shaped leaf of its block. States are numbered since
 * names need not be unique.
 */
std::ostream& dot( std::ostream& stream, const dmi::metadata& meta ) {
    stream << "strict graph {" << std::endl;

    const auto& h = meta.header;
    stream << "root -- header[shape=box]\n";
    int it = 0;
    property( stream, "header", it++, "version = " + str( h.version ) );
    property( stream, "header", it++, "width = "   + str( h.width ) );
    property( stream, "header", it++, "height = "  + str( h.height ) );
    for( const auto& x : h.unknown )
        property( stream, "header", it++, x.first + " = " + str( x.second ) );

    int rec = 0;
    for( const auto& s : meta.states ) {
        const auto node = "state_" + std::to_string( rec++ );
        stream << "root -- " << node
               << "[shape=box, label=\"" << escape( s.name ) << "\"]\n";

        /* the state's own printout is one property per line */
        const auto lines = str( s );
        std::string::size_type fst = lines.find( '\n' );
        it = 0;
        while( fst != std::string::npos ) {
            auto lst = lines.find( '\n', fst + 1 );
            auto label = lines.substr( fst + 1, lst == std::string::npos
                                              ? std::string::npos
                                              : lst - fst - 1 );
            label.erase( 0, label.find_first_not_of( ' ' ) );
            property( stream, node, it++, label );
            fst = lst;
        }
    }

    return stream << "}";
}

}

int main( int argc, char** argv ) {
    const bool graph = argc == 3 && std::strcmp( argv[ 1 ], "--dot" ) == 0;

    if( argc != 2 && !graph ) {
        std::cout << "Usage: " << argv[ 0 ] << " [--dot] INPUT\n";
        return 1;
    }

    const std::string filename{ argv[ argc - 1 ] };

    try {
        const auto meta = dmi::load( filename );

        if( graph ) dot( std::cout, meta ) << std::endl;
        else        std::cout << meta;

    } catch( const dmi::error& e ) {
        std::cerr << filename << ": " << e.what() << std::endl;
        return 1;
    } catch( const std::ios_base::failure& e ) {
        std::cerr << filename << ": " << e.what() << std::endl;
        return 1;
    }
}
