#include "srelvis/color.hpp"

#include <cstdio>

#include <unistd.h>

namespace srelvis::color {

bool isTty(Stream stream) {
    switch (stream) {
        case Stream::Stdout: return ::isatty(fileno(stdout)) != 0;
        case Stream::Stderr: return ::isatty(fileno(stderr)) != 0;
        case Stream::Other: return false;
    }
    return false;
}

} // namespace srelvis::color
