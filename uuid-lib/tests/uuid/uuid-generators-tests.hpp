#ifndef UUID_GENERATORS_TESTS_HPP
#define UUID_GENERATORS_TESTS_HPP
#include "../../src/uuid/uuid.hpp"
namespace tests{
    class UuidGeneratorsTests
    {
    public:
        constexpr static struct Random{} test_random{};
        constexpr static struct TimeBased{} test_time_based{};
        constexpr static struct TimeBasedEpochs{} test_time_based_epochs{};
        constexpr static struct TimeBasedNow{} test_time_based_now{};
        constexpr static struct Md5Name{} test_md5_name{};
        constexpr static struct Sha1Name{} test_sha1_name{};

        explicit UuidGeneratorsTests(Random);
        explicit UuidGeneratorsTests(TimeBased);
        explicit UuidGeneratorsTests(TimeBasedEpochs);
        explicit UuidGeneratorsTests(TimeBasedNow);
        explicit UuidGeneratorsTests(Md5Name);
        explicit UuidGeneratorsTests(Sha1Name);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        UUID::Uuid uuid_;
    };
}
#endif
