// C system headers
#include <unistd.h>

// C++ headers
#include <cstdio>
#include <cstdlib>

#include "parcelsort/parcelsort.hpp"

namespace {

struct SamplePackage {
  double width;
  double height;
  double length;
  double mass;
  const char* description;
};

constexpr SamplePackage kSamples[] = {
    {50.0, 50.0, 50.0, 10.0, "Standard package"},
    {100.0, 100.0, 100.0, 10.0, "Bulky by volume"},
    {160.0, 50.0, 50.0, 10.0, "Bulky by dimension"},
    {50.0, 50.0, 50.0, 25.0, "Heavy package"},
    {160.0, 50.0, 50.0, 25.0, "Bulky and heavy"},
};

struct CommandLineOptions {
  bool strict = false;
  bool has_package = false;
  double values[4] = {0.0, 0.0, 0.0, 0.0};  // width, height, length, mass
};

void PrintUsage(FILE* out, const char* prog) {
  std::fprintf(out,
               "Usage: %s [-s] [-h] [--] [WIDTH HEIGHT LENGTH MASS]\n"
               "\n"
               "Without arguments, classify the built-in sample packages.\n"
               "Option parsing stops at the first number, so negative\n"
               "measurements need no \"--\" (it is accepted as well).\n"
               "\n"
               "Options:\n"
               "  -s  Reject negative, NaN or infinite measurements\n"
               "  -h  Show this help\n",
               prog);
}

bool ParseMeasurement(const char* text, double* out) {
  char* end = nullptr;
  const double v = std::strtod(text, &end);
  if (end == text || *end != '\0') return false;
  *out = v;
  return true;
}

CommandLineOptions ParseOptions(int argc, char* argv[]) {
  CommandLineOptions opts;

  // "+" stops at the first non-option; a leading number such as "-10"
  // ends option parsing too, so negative measurements reach the
  // positional parser.
  int c = 0;
  double ignored = 0.0;
  while (optind < argc && !ParseMeasurement(argv[optind], &ignored) &&
         (c = getopt(argc, argv, "+sh")) != -1) {
    switch (c) {
      case 's':
        opts.strict = true;
        break;
      case 'h':
        PrintUsage(stdout, argv[0]);
        std::exit(0);
      default:
        PrintUsage(stderr, argv[0]);
        std::exit(-1);
    }
  }

  const int positional = argc - optind;
  if (positional == 0) return opts;
  if (positional != 4) {
    std::fprintf(stderr, "Expected 4 measurements, got %d\n", positional);
    PrintUsage(stderr, argv[0]);
    std::exit(-1);
  }
  for (int i = 0; i < 4; ++i) {
    if (!ParseMeasurement(argv[optind + i], &opts.values[i])) {
      std::fprintf(stderr, "Invalid number: %s\n", argv[optind + i]);
      PrintUsage(stderr, argv[0]);
      std::exit(-1);
    }
  }
  opts.has_package = true;
  return opts;
}

// Returns false if strict validation rejected the package.
bool ReportPackage(const char* description, const parcelsort::Package& pkg,
                   bool strict) {
  parcelsort::Category category = parcelsort::Category::kStandard;
  if (strict) {
    auto r = parcelsort::ClassifyChecked(pkg);
    if (!r) {
      std::fprintf(stderr, "%s: %s\n", description, r.Message().c_str());
      return false;
    }
    category = r.MoveValue();
  } else {
    category = parcelsort::Classify(pkg);
  }
  using parcelsort::FormatMeasurement;
  std::printf("%s: %sx%sx%s cm, %s kg -> %s\n", description,
              FormatMeasurement(pkg.Width().Value()).c_str(),
              FormatMeasurement(pkg.Height().Value()).c_str(),
              FormatMeasurement(pkg.Length().Value()).c_str(),
              FormatMeasurement(pkg.Mass().Value()).c_str(),
              parcelsort::CategoryToString(category));
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using parcelsort::Centimeters;
  using parcelsort::Kilograms;

  const CommandLineOptions options = ParseOptions(argc, argv);

  if (options.has_package) {
    const parcelsort::Package pkg(
        Centimeters(options.values[0]), Centimeters(options.values[1]),
        Centimeters(options.values[2]), Kilograms(options.values[3]));
    return ReportPackage("Package", pkg, options.strict) ? 0 : 1;
  }

  std::printf("Package Sorting System\n\n");
  int failures = 0;
  for (const SamplePackage& s : kSamples) {
    const parcelsort::Package pkg(Centimeters(s.width), Centimeters(s.height),
                                  Centimeters(s.length), Kilograms(s.mass));
    if (!ReportPackage(s.description, pkg, options.strict)) ++failures;
  }
  return failures == 0 ? 0 : 1;
}
