#pragma once
#include <banditry_bits/util/exceptions.hpp>
#include <banditry_bits/util/macros.hpp>
#include <cmath>
#include <ostream>
#include <string>

namespace banditry {
namespace data {

/*
 * Accumulated observations of a single arm.
 * total is the number of trials and need not equal win + loss
 * (e.g. draws count toward total only).
 */
template <class ValueType>
struct SampledArm {
    using value_t = ValueType;

   private:
    value_t win_ = 0;
    value_t loss_ = 0;
    value_t total_ = 0;

   public:
    SampledArm() = default;
    SampledArm(value_t win, value_t loss, value_t total)
        : win_(win), loss_(loss), total_(total) {}

    value_t win() const { return win_; }
    value_t loss() const { return loss_; }
    value_t total() const { return total_; }

    /*
     * Average payoff (win - loss) / total.
     * An arm that was never sampled has payoff 0.
     */
    BANDITRY_STRONG_INLINE value_t payoff() const {
        return (total_ > 0) ? (win_ - loss_) / total_ : value_t(0);
    }

    /*
     * Throws invalid_historical_info_error if any count
     * is negative or not finite.
     */
    void validate(const std::string& name) const {
        check_count(name, "win", win_);
        check_count(name, "loss", loss_);
        check_count(name, "total", total_);
    }

    SampledArm& operator+=(const SampledArm& other) {
        win_ += other.win_;
        loss_ += other.loss_;
        total_ += other.total_;
        return *this;
    }

    friend SampledArm operator+(SampledArm lhs, const SampledArm& rhs) {
        lhs += rhs;
        return lhs;
    }

    friend bool operator==(const SampledArm& lhs, const SampledArm& rhs) {
        return (lhs.win_ == rhs.win_) && (lhs.loss_ == rhs.loss_) &&
               (lhs.total_ == rhs.total_);
    }

    friend bool operator!=(const SampledArm& lhs, const SampledArm& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const SampledArm& arm) {
        os << "{win: " << arm.win_ << ", loss: " << arm.loss_
           << ", total: " << arm.total_ << "}";
        return os;
    }

   private:
    static void check_count(const std::string& name, const char* field,
                            value_t v) {
        if (!std::isfinite(v)) {
            throw invalid_historical_info_error(
                name, std::string(field) + " must be finite.");
        }
        if (v < 0) {
            throw invalid_historical_info_error(
                name, std::string(field) + " must be non-negative.");
        }
    }
};

}  // namespace data
}  // namespace banditry
