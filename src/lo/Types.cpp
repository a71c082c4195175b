#include "lo/Types.hpp"
#include "lo/Error.hpp"

#include <string>

namespace pglo::lo {

uint32_t flagsFor(const Mode mode) {
    switch (mode) {
        case Mode::Read: return INV_READ;
        case Mode::Write:
        case Mode::Append: return INV_WRITE;
        case Mode::ReadWrite: return INV_READ | INV_WRITE;
    }
    throw Error(ErrorKind::InvalidMode, "flagsFor",
                "invalid mode: " + std::to_string(static_cast<int>(mode)));
}

bool isWritable(const Mode mode) { return (flagsFor(mode) & INV_WRITE) != 0; }

Mode parseMode(const std::string_view name) {
    if (name == "read") return Mode::Read;
    if (name == "write") return Mode::Write;
    if (name == "read_write") return Mode::ReadWrite;
    if (name == "append") return Mode::Append;
    throw Error(ErrorKind::InvalidMode, "parseMode", "invalid mode: " + std::string(name));
}

std::string_view modeName(const Mode mode) {
    switch (mode) {
        case Mode::Read: return "read";
        case Mode::Write: return "write";
        case Mode::ReadWrite: return "read_write";
        case Mode::Append: return "append";
    }
    throw Error(ErrorKind::InvalidMode, "modeName",
                "invalid mode: " + std::to_string(static_cast<int>(mode)));
}

std::string_view whenceName(const Whence whence) {
    switch (whence) {
        case Whence::Start: return "start";
        case Whence::Current: return "current";
        case Whence::End: return "end";
    }
    return "unknown";
}

}
