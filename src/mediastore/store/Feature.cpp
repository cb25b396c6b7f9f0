#include <mediastore/store/Feature.hpp>

#include <atomic>

namespace MS::detail {

auto generateFeatureName() -> std::string {
    static std::atomic<std::uint64_t> counter{0};
    return "feature-" + std::to_string(++counter);
}

} // namespace MS::detail
