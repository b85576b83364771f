#include "debug.hpp"

std::mutex& Debug::outputMutex() {
    static std::mutex mutex;
    return mutex;
}
