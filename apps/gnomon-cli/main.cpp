/**
 * gnomon-cli: optimize and rename a folder of photos for the bi-gnomon gallery.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/gnomon_cli --input <dir> --output <dir> --event <name> [--width 1920] [--quality 82]
 * Originals are copied to <output-parent>/<output-name>_originals.
 */

#include <gnomon/app/cli.hpp>

#include <exiv2/exiv2.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
  return gnomon::app::run_cli(argc, argv, std::cout, std::cerr);
}
