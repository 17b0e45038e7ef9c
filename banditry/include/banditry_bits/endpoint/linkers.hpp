#pragma once
#include <banditry_bits/bandit/base.hpp>
#include <banditry_bits/bandit/epsilon/epsilon_first.hpp>
#include <banditry_bits/constant.hpp>
#include <banditry_bits/endpoint/hyperparameter_info.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace banditry {
namespace endpoint {

/*
 * Links a subtype name to the routine that validates
 * hyperparameters and constructs the corresponding bandit.
 */
template <class ValueType>
struct BanditMethod {
    using value_t = ValueType;
    using bandit_t = bandit::BanditBase<value_t>;
    using historical_info_t = typename bandit_t::historical_info_t;
    using hyperparameter_info_t = hyperparameter_info_type<value_t>;
    using factory_t = std::function<std::unique_ptr<bandit_t>(
        const historical_info_t&, const hyperparameter_info_t&)>;

    std::string subtype;
    factory_t make_bandit;
};

/*
 * Lookup table from epsilon subtype name to bandit method.
 * The table is filled once on construction and read-only afterwards.
 */
template <class ValueType>
struct EpsilonLinker {
    using value_t = ValueType;
    using method_t = BanditMethod<value_t>;
    using bandit_t = typename method_t::bandit_t;
    using historical_info_t = typename method_t::historical_info_t;
    using hyperparameter_info_t = typename method_t::hyperparameter_info_t;

   private:
    std::map<std::string, method_t> methods_;

    void add(method_t method) {
        auto name = method.subtype;
        methods_.emplace(std::move(name), std::move(method));
    }

   public:
    EpsilonLinker() {
        add({epsilon_subtype_first,
             [](const historical_info_t& hi,
                const hyperparameter_info_t& info) -> std::unique_ptr<bandit_t> {
                 using hp_t = EpsilonFirstHyperparameterInfo<value_t>;
                 const auto hp = hp_t::deserialize(info);
                 return std::make_unique<bandit::epsilon::EpsilonFirst<value_t>>(
                     hi, hp.epsilon, hp.total_samples);
             }});
    }

    /*
     * Process-wide linker, constructed on first use.
     */
    static const EpsilonLinker& instance() {
        static const EpsilonLinker linker;
        return linker;
    }

    bool contains(const std::string& subtype) const {
        return methods_.find(subtype) != methods_.end();
    }

    const method_t& at(const std::string& subtype) const {
        auto it = methods_.find(subtype);
        if (it == methods_.end()) {
            throw unknown_subtype_error(subtype);
        }
        return it->second;
    }

    std::vector<std::string> subtypes() const {
        std::vector<std::string> out;
        out.reserve(methods_.size());
        for (const auto& kv : methods_) {
            out.push_back(kv.first);
        }
        return out;
    }

    std::unique_ptr<bandit_t> make_bandit(
        const std::string& subtype, const historical_info_t& hi,
        const hyperparameter_info_t& info) const {
        return at(subtype).make_bandit(hi, info);
    }
};

}  // namespace endpoint
}  // namespace banditry
