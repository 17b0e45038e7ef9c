#pragma once
#include <banditry_bits/data/sampled_arm.hpp>
#include <banditry_bits/util/types.hpp>
#include <map>
#include <ostream>
#include <string>
#include <utility>

namespace banditry {
namespace data {

/*
 * Snapshot of the observations of every arm in an experiment.
 * Arms are keyed by name and iterated in lexicographic order.
 * Bandits only read from this object; callers own it and
 * must keep it alive for as long as a bandit refers to it.
 */
template <class ValueType>
struct HistoricalInfo {
    using value_t = ValueType;
    using sampled_arm_t = SampledArm<value_t>;
    using arms_sampled_t = std::map<std::string, sampled_arm_t>;

   private:
    arms_sampled_t arms_sampled_;

   public:
    HistoricalInfo() = default;
    HistoricalInfo(arms_sampled_t arms_sampled)
        : arms_sampled_(std::move(arms_sampled)) {}

    const arms_sampled_t& arms_sampled() const { return arms_sampled_; }
    size_t num_arms() const { return arms_sampled_.size(); }
    bool empty() const { return arms_sampled_.empty(); }

    /*
     * Total number of trials recorded across all arms.
     */
    value_t num_sampled() const {
        value_t n = 0;
        for (const auto& kv : arms_sampled_) {
            n += kv.second.total();
        }
        return n;
    }

    /*
     * Returns the payoff of each arm, in arm name order.
     */
    colvec_type<value_t> payoffs() const {
        colvec_type<value_t> out(arms_sampled_.size());
        size_t i = 0;
        for (const auto& kv : arms_sampled_) {
            out[i++] = kv.second.payoff();
        }
        return out;
    }

    /*
     * Merges new observations into the snapshot.
     * Counts of existing arms are added to; unseen arms are inserted.
     */
    void update_historical_data(const arms_sampled_t& arms_sampled) {
        for (const auto& kv : arms_sampled) {
            arms_sampled_[kv.first] += kv.second;
        }
    }

    void update_historical_data(const std::string& name,
                                const sampled_arm_t& arm) {
        arms_sampled_[name] += arm;
    }

    void validate() const {
        for (const auto& kv : arms_sampled_) {
            kv.second.validate(kv.first);
        }
    }

    friend bool operator==(const HistoricalInfo& lhs,
                           const HistoricalInfo& rhs) {
        return lhs.arms_sampled_ == rhs.arms_sampled_;
    }

    friend bool operator!=(const HistoricalInfo& lhs,
                           const HistoricalInfo& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os,
                                    const HistoricalInfo& hi) {
        os << "{";
        bool first = true;
        for (const auto& kv : hi.arms_sampled_) {
            if (!first) os << ", ";
            os << kv.first << ": " << kv.second;
            first = false;
        }
        os << "}";
        return os;
    }
};

}  // namespace data
}  // namespace banditry
