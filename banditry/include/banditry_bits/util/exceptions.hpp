#pragma once
#include <exception>
#include <string>
#include <utility>

namespace banditry {

struct banditry_error : std::exception {
    banditry_error(std::string msg) : msg_(std::move(msg)) {}

    const char* what() const noexcept override { return msg_.data(); }

   private:
    std::string msg_;
};

struct empty_history_error : banditry_error {
    empty_history_error()
        : banditry_error("arms_sampled is empty. Provide at least one arm.") {}
};

struct invalid_allocation_error : banditry_error {
    using banditry_error::banditry_error;
};

struct invalid_hyperparameter_error : banditry_error {
    invalid_hyperparameter_error(const std::string& key,
                                 const std::string& reason)
        : banditry_error("Invalid hyperparameter " + key + ": " + reason) {}
};

struct invalid_historical_info_error : banditry_error {
    invalid_historical_info_error(const std::string& arm_name,
                                  const std::string& reason)
        : banditry_error("Invalid sampled arm " + arm_name + ": " + reason) {}
};

struct unknown_subtype_error : banditry_error {
    unknown_subtype_error(const std::string& subtype)
        : banditry_error("Unknown bandit subtype: " + subtype) {}
};

}  // namespace banditry
