#include <string>

#include <sys/stat.h>

#include <boost/iostreams/device/mapped_file.hpp>

#include <dmi/parser.hpp>

namespace dmi {

metadata load( const std::string& path ) {
    using mmapd = boost::iostreams::mapped_file_source;

    // an empty file cannot be mapped, but it is still a (bad) document
    struct stat st;
    if( ::stat( path.c_str(), &st ) == 0 && st.st_size == 0 )
        return parse( std::string() );

    const mmapd file{ path };
    return parse( file.begin(), file.end() );
}

}
