#include <syncset/util/threading.hpp>
#include <thread>

namespace syncset {

size_t get_cpu_count() {
    if (getenv("CI")) {
        return 2;
    }
    size_t count = std::thread::hardware_concurrency();
    return count ? count : 1;
}

}  // namespace syncset
