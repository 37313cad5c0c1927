#include "compiler/compilation_config.hpp"
#include "io/read.hpp"
#include "io/tokenizer.hpp"
#include "io/write.hpp"
#include "parens.hpp"
#include "vm/vm.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <exception>
#include <stdexcept>
#include <string>
#include <variant>

namespace {
  enum class mode {
    evaluate,
    quote,
    compile
  };

  struct options {
    mode                       run_mode = mode::evaluate;
    bool                       warnings = false;
    std::optional<std::size_t> max_call_depth;
    std::optional<std::string> expression;
    std::optional<std::string> file;
  };

  class options_parse_error : public std::runtime_error {
  public:
    options_parse_error()
      : std::runtime_error{"Bad option"}
    { }
  };
}

static void
print_usage(char const* program_name) {
  std::cout << fmt::format("{} [<options> ...] [<file>]", program_name);
  std::cout << R"(
Options:
  -e <expression>  -- run the expression instead of a file
  -q               -- print the parsed S-expressions instead of running them
  -c               -- print the transformed program instead of running it
  -w               -- show warnings
  -d <depth>       -- set the maximum call depth; default: 1000
)";
}

static std::size_t
parse_depth(std::string const& argument) {
  std::size_t end = 0;
  unsigned long long depth = 0;
  try {
    depth = std::stoull(argument, &end);
  } catch (std::logic_error const&) {
    throw options_parse_error{};
  }

  if (end != argument.size() || depth == 0)
    throw options_parse_error{};
  return static_cast<std::size_t>(depth);
}

static options
parse_options(int argc, char** argv) {
  options opts;

  for (int i = 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag.size() > 1 && flag[0] == '-') {
      if (flag == "-q")
        opts.run_mode = mode::quote;
      else if (flag == "-c")
        opts.run_mode = mode::compile;
      else if (flag == "-w")
        opts.warnings = true;
      else if (flag == "-e" || flag == "-d") {
        if (i + 1 == argc)
          throw options_parse_error{};

        std::string argument = argv[++i];
        if (flag == "-e")
          opts.expression = std::move(argument);
        else
          opts.max_call_depth = parse_depth(argument);
      } else
        throw options_parse_error{};
    } else if (!opts.file)
      opts.file = std::move(flag);
    else
      throw options_parse_error{};
  }

  if (opts.file && opts.expression)
    throw options_parse_error{};

  return opts;
}

static std::string
read_file(std::string const& path) {
  std::ifstream in{path};
  if (!in)
    throw std::runtime_error{fmt::format("Can't open {}", path)};

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static void
show_error(std::exception const& e) {
  std::cout << std::flush << fmt::format("Error: {}", e.what()) << '\n';
}

static void
run_source(parens::vm& state, options const& opts, std::string const& source,
           std::string const& file_name,
           parens::transform_config const& config) {
  switch (opts.run_mode) {
  case mode::quote:
    for (parens::sexpr const& x : parens::parse(source, file_name))
      std::cout << parens::pp(x) << '\n';
    break;

  case mode::compile:
    std::cout << parens::compile(source, config, file_name) << '\n';
    break;

  case mode::evaluate:
    parens::eval(state, source, config, file_name);
    break;
  }
}

// Number of opening brackets that haven't been closed yet. The REPL keeps
// reading lines while this is positive.
static int
open_brackets(std::string const& source) {
  int depth = 0;
  for (parens::token const& t : parens::tokenize(source, "<stdin>"))
    if (std::holds_alternative<parens::token::left_paren>(t.value)
        || std::holds_alternative<parens::token::left_bracket>(t.value)
        || std::holds_alternative<parens::token::left_brace>(t.value))
      ++depth;
    else if (std::holds_alternative<parens::token::right_paren>(t.value)
             || std::holds_alternative<parens::token::right_bracket>(t.value)
             || std::holds_alternative<parens::token::right_brace>(t.value))
      --depth;
  return depth;
}

static void
run_repl(parens::vm& state, options const& opts,
         parens::transform_config const& config) {
  std::string source;
  std::string line;
  while (true) {
    std::cout << (source.empty() ? "> " : "  ") << std::flush;
    if (!std::getline(std::cin, line))
      return;

    source += line;
    source += '\n';

    try {
      if (open_brackets(source) > 0)
        continue;

      if (opts.run_mode == mode::evaluate) {
        parens::value result = parens::eval(state, source, config, "<stdin>");
        std::cout << parens::value_to_string(result) << '\n';
      } else
        run_source(state, opts, source, "<stdin>", config);
    } catch (std::exception const& e) {
      show_error(e);
    }

    source.clear();
  }
}

static int
run(int argc, char** argv) {
  options opts = parse_options(argc, argv);

  parens::vm_config vm_config;
  if (opts.max_call_depth)
    vm_config.max_call_depth = *opts.max_call_depth;
  parens::vm state{vm_config};

  parens::stream_diagnostic_sink diag_sink{std::cout};
  parens::transform_config config
    = opts.warnings ? parens::transform_config{diag_sink}
                    : parens::transform_config::default_config();

  if (opts.expression)
    run_source(state, opts, *opts.expression, "<expression>", config);
  else if (opts.file)
    run_source(state, opts, read_file(*opts.file), *opts.file, config);
  else
    run_repl(state, opts, config);

  return EXIT_SUCCESS;
}

int
main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (options_parse_error const&) {
    print_usage(argv[0]);
    return 1;
  } catch (std::exception const& e) {
    show_error(e);
    return 1;
  }
}
