#include <algorithm>
#include <cstdlib>
#include <ios>
#include <iostream>
#include <numeric>
#include <vector>

#include <ctime>

#include <dmi/parser.hpp>

int main( int argc, char** argv ) {
    if( argc != 3 ) {
        std::cout << "Usage: " << argv[ 0 ] << " ITERATIONS INPUT\n";
        return 1;
    }

    const auto iterations = std::atoi( argv[ 1 ] );
    if( iterations <= 0 ) {
        std::cerr << "ITERATIONS must be a positive number\n";
        return 1;
    }

    std::size_t states = 0;

    timespec start, stop;
    std::vector< double > timings;
    timings.reserve( iterations );

    try {
        for( int i = 0; i < iterations; ++i ) {
            clock_gettime( CLOCK_REALTIME, &start );
            auto meta = dmi::load( argv[ 2 ] );
            clock_gettime( CLOCK_REALTIME, &stop );

            double duration = ( stop.tv_sec - start.tv_sec )
                + ( stop.tv_nsec - start.tv_nsec )
                / 1e9;

            timings.push_back( duration );
            states = meta.states.size();
        }
    } catch( const dmi::error& e ) {
        std::cerr << argv[ 2 ] << ": " << e.what() << "\n";
        return 1;
    } catch( const std::ios_base::failure& e ) {
        std::cerr << argv[ 2 ] << ": " << e.what() << "\n";
        return 1;
    }

    std::sort( timings.begin(), timings.end() );

    double total = std::accumulate( timings.begin(), timings.end(), 0.0 );
    double average = total / iterations;
    double mode = -1;
    int count = -1;

    int i = 0;
    while( i < iterations ) {
        const auto current = timings[i];
        const auto start   = i;

        /* within 0.1ms == equal */
        while( i < iterations && (timings[i] - current) < 1e-4 )
            ++i;

        const auto countMode = i - start;

        if( countMode > count ) {
            mode = current;
            count = countMode;
        }
    }

    std::cout << "States: " << states << "\n"
              << "Iterations: " << iterations << "\n"
              << "Total time: " << total << "\n"
              << "Average: " << average << "\n"
              << "Mode: " << mode << "\n"
              ;
}
