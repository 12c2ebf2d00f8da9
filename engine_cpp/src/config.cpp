/// @file config.cpp

#include <evochess/config.hpp>

#include <chrono>

namespace evochess {

double steady_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace evochess
