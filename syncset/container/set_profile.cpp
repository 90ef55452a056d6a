#include <tbb/concurrent_unordered_set.h>

#include <syncset/container/set.hpp>
#include <syncset/util/threading.hpp>
#include <thread>
#include <vector>

using namespace syncset;

typedef ConcurrentSet<size_t> Set;

template <class Function>
void print_rate(std::string name, size_t op_count, Function function) {
    Timer timer;
    function();
    double rate_mhz = op_count / timer.elapsed() / 1e6;
    SYNCSET_INFO(std::setw(24) << name << std::setw(12) << rate_mhz
                               << " ops/usec");
}

// writers insert random values while readers look them up
template <class Insert, class Find>
void run_readers_writers(size_t worker_count, size_t op_count, Insert insert,
                         Find find) {
    std::vector<std::thread> threads;
    for (size_t w = 0; w < worker_count; ++w) {
        threads.push_back(std::thread([w, worker_count, op_count, insert] {
            rng_t rng(w);
            std::uniform_int_distribution<size_t> random_value(0, op_count);
            for (size_t i = 0; i < op_count / worker_count; ++i) {
                insert(random_value(rng));
            }
        }));
        threads.push_back(std::thread([w, worker_count, op_count, find] {
            rng_t rng(worker_count + w);
            std::uniform_int_distribution<size_t> random_value(0, op_count);
            for (size_t i = 0; i < op_count / worker_count; ++i) {
                find(random_value(rng));
            }
        }));
    }
    for (auto &thread : threads) {
        thread.join();
    }
}

void profile_single_thread(size_t op_count) {
    SYNCSET_INFO("single thread, " << op_count << " ops");
    for (bool unsafe : {false, true}) {
        Set set(unsafe);
        print_rate(unsafe ? "unsafe add" : "safe add", op_count, [&] {
            for (size_t i = 0; i < op_count; ++i) {
                set.add(i);
            }
        });
        print_rate(unsafe ? "unsafe contains" : "safe contains", op_count,
                   [&] {
                       size_t found = 0;
                       for (size_t i = 0; i < op_count; ++i) {
                           found += set.contains(2 * i);
                       }
                       SYNCSET_ASSERT_EQ(found, (op_count + 1) / 2);
                   });
    }
}

void profile_algebra(size_t op_count) {
    SYNCSET_INFO("set algebra, " << op_count << " values per operand");
    Set evens;
    Set odds;
    Set threes;
    for (size_t i = 0; i < op_count; ++i) {
        (i % 2 ? odds : evens).add(i);
        if (i % 3 == 0) threes.add(i);
    }
    print_rate("set_union", op_count, [&] {
        SYNCSET_ASSERT_EQ(evens.set_union(odds).size(), op_count);
    });
    print_rate("set_insn", op_count, [&] { evens.set_insn(threes); });
    print_rate("set_diff", op_count, [&] { evens.set_diff(threes); });
    print_rate("equal", op_count, [&] { evens.equal(odds); });
}

void profile_concurrent(size_t worker_count, size_t op_count) {
    SYNCSET_INFO(worker_count << " writers + " << worker_count << " readers, "
                              << op_count << " ops");

    Set set;
    print_rate("ConcurrentSet", 2 * op_count, [&] {
        run_readers_writers(worker_count, op_count,
                            [&set](size_t value) { set.add(value); },
                            [&set](size_t value) { set.contains(value); });
    });

    tbb::concurrent_unordered_set<size_t> tbb_set;
    print_rate("tbb::concurrent_unordered_set", 2 * op_count, [&] {
        run_readers_writers(
            worker_count, op_count,
            [&tbb_set](size_t value) { tbb_set.insert(value); },
            [&tbb_set](size_t value) { tbb_set.count(value); });
    });

    SYNCSET_ASSERT_EQ(set.size(), tbb_set.size());
}

int main() {
    Log::Context log_context("ConcurrentSet profile");

    const size_t op_count = getenv_default("SYNCSET_PROFILE_OPS", 1000000UL);
    profile_single_thread(op_count);
    profile_algebra(op_count);
    for (size_t workers = 1; workers <= get_cpu_count(); workers *= 2) {
        profile_concurrent(workers, op_count);
    }

    return 0;
}
