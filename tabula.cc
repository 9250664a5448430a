// Standard library includes
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "tabula.hh"

namespace {

  struct Options {
    std::vector< std::string > documents;
    std::optional< std::string > roll;
    std::optional< std::string > pattern;
    bool list = false;
    bool trace = false;
    std::optional< std::uint32_t > seed;
    int count = 1;
  };

  void usage( std::ostream& os ) {
    os << "Usage: tabula [options] DOCUMENT [DOCUMENT...]\n"
      << "  --roll ID       roll a table (or a template with that id)\n"
      << "  --pattern TEXT  evaluate a raw pattern\n"
      << "  --list          list tables and templates of the first document\n"
      << "  --trace         include the execution trace\n"
      << "  --seed N        fix the random seed\n"
      << "  --count N       repeat the roll N times\n";
  }

  std::int64_t numeric_arg( const std::string& flag, const std::string& value ) {
    auto n = tabula::internal::parse_int_prefix( value );
    if ( !n || !tabula::internal::is_all_digits(value) ) {
      throw std::runtime_error( flag + " expects a non-negative integer, got '"
        + value + "'" );
    }
    return *n;
  }

  Options parse_args( int argc, char* argv[] ) {
    Options opt;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto value = [&]() -> std::string {
        if ( i + 1 >= argc ) throw std::runtime_error( arg + " expects a value" );
        return argv[ ++i ];
      };

      if ( arg == "--roll" ) opt.roll = value();
      else if ( arg == "--pattern" ) opt.pattern = value();
      else if ( arg == "--list" ) opt.list = true;
      else if ( arg == "--trace" ) opt.trace = true;
      else if ( arg == "--seed" ) {
        opt.seed = static_cast< std::uint32_t >( numeric_arg(arg, value()) );
      }
      else if ( arg == "--count" ) {
        opt.count = static_cast< int >( numeric_arg(arg, value()) );
      }
      else if ( arg == "-h" || arg == "--help" ) {
        usage( std::cout );
        std::exit( 0 );
      }
      else if ( !arg.empty() && arg[0] == '-' ) {
        throw std::runtime_error( "unknown option " + arg );
      }
      else opt.documents.push_back( arg );
    }
    if ( opt.documents.empty() ) {
      usage( std::cerr );
      throw std::runtime_error( "no document given" );
    }
    return opt;
  }

  void print_issues( const std::string& path,
    const tabula::ValidationResult& validation )
  {
    for ( const auto& issue : validation.issues ) {
      std::cerr << "[tabula] " << tabula::severity_name( issue.severity ) << ": "
        << path << ": " << issue.message;
      if ( issue.path ) std::cerr << " (" << *issue.path << ')';
      std::cerr << '\n';
    }
  }

} // anonymous namespace

int main( int argc, char* argv[] ) {
  try {
    const Options opt = parse_args( argc, argv );

    tabula::Engine engine( tabula::EngineConfig(), opt.seed );
    engine.diagnostics().set_echo( &std::cerr );

    // Collection ids are the file paths, so imports may name files directly
    std::map< std::string, std::string > path_to_id;
    for ( const auto& path : opt.documents ) {
      const tabula::ValidationResult validation = engine.load_from_file( path,
        path );
      print_issues( path, validation );
      if ( !validation.valid ) {
        throw tabula::Error( tabula::ErrorCode::Validation, "document " + path
          + " is not valid" );
      }
      path_to_id[ path ] = path;
    }
    engine.resolve_imports( path_to_id );

    const std::string& primary = opt.documents.front();
    tabula::RollOptions roll_options;
    roll_options.enable_trace = opt.trace;

    tabula::ordered_node out = tabula::ordered_node::mapping();

    if ( opt.list ) {
      std::vector< tabula::ordered_node > tables;
      for ( const auto& t : engine.list_tables(primary, true) ) {
        tables.push_back( tabula::to_node(t) );
      }
      std::vector< tabula::ordered_node > templates;
      for ( const auto& t : engine.list_templates(primary) ) {
        templates.push_back( tabula::to_node(t) );
      }
      out[ "tables" ] = tabula::internal::make_node_from( tables );
      out[ "templates" ] = tabula::internal::make_node_from( templates );
    }

    std::vector< tabula::ordered_node > results;
    for ( int i = 0; i < opt.count; ++i ) {
      if ( opt.roll ) {
        const bool is_table = engine.get_table( *opt.roll, primary ) != nullptr;
        results.push_back( tabula::to_node( is_table
          ? engine.roll( *opt.roll, primary, roll_options )
          : engine.roll_template( *opt.roll, primary, roll_options ) ) );
      }
      else if ( opt.pattern ) {
        results.push_back( tabula::to_node(
          engine.evaluate_raw_pattern( *opt.pattern, primary, roll_options ) ) );
      }
    }
    if ( !results.empty() ) {
      out[ "results" ] = tabula::internal::make_node_from( results );
    }

    std::cout << tabula::ordered_node::serialize( out );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[tabula] error: " << ex.what() << "\n";
    return 1;
  }
}
