#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/chancat.hpp>
#include <bes/channel.hpp>

#include "channels/builtin.hpp"

/* Notes on implementation:
 *
 * The catalogue maintains two maps:
 *
 * 1. proto_map_ holds the prototype model for every un-derived channel.
 *
 * 2. derived_map_ holds for every derived channel its parent (which may
 *    itself be derived), the parameter overrides and the ion renamings
 *    relative to that parent.
 *
 * Together they form a forest rooted in proto_map_. An instance of a derived
 * channel is made by cloning the root prototype and applying the overrides
 * of each derivation from the root down to the requested channel.
 *
 * The private implementation class catalogue_state does not throw catalogue
 * related exceptions, but propagates errors as exception pointers through
 * `hopefully` values to the channel_catalogue methods for handling.
 */

namespace bes {

using std::make_exception_ptr;

template <typename V>
using string_map = std::unordered_map<std::string, V>;

namespace {

// Value or the exception describing why there is none.
template <typename T>
struct hopefully {
    std::optional<T> result;
    std::exception_ptr error;

    hopefully(T x): result(std::move(x)) {}
    hopefully(std::exception_ptr e): error(std::move(e)) {}

    explicit operator bool() const { return result.has_value(); }
    T& value() { return *result; }
    const T& value() const { return *result; }
};

template <typename X>
std::exception_ptr fail(X x) { return make_exception_ptr(std::move(x)); }

// Convert hopefully<T> to T or throw.
template <typename T>
T value(hopefully<T>&& x) {
    if (!x) std::rethrow_exception(x.error);
    return std::move(x.value());
}

} // anonymous namespace

struct derivation {
    std::string parent;
    std::vector<std::pair<std::string, double>> params;
    std::vector<std::pair<std::string, std::string>> ion_remap;
};

// (Pimpl) catalogue state.

struct catalogue_state {
    catalogue_state() = default;

    catalogue_state(const catalogue_state& other):
        derived_map_(other.derived_map_)
    {
        for (const auto& kv: other.proto_map_) {
            proto_map_[kv.first] = kv.second->clone();
        }
    }

    // Check for presence of channel or derived channel.
    bool defined(const std::string& name) const {
        return proto_map_.count(name) || derived_map_.count(name);
    }

    bool is_derived(const std::string& name) const {
        return derived_map_.count(name) || (!defined(name) && (bool)derive(name));
    }

    void bind(const std::string& name, channel_ptr proto) {
        proto->set_name(name);
        proto_map_[name] = std::move(proto);
    }

    void bind(const std::string& name, derivation deriv) {
        derived_map_[name] = std::move(deriv);
    }

    // Remove channel and every derivation depending on it.
    void remove(const std::string& name) {
        derived_map_.erase(name);
        proto_map_.erase(name);

        std::size_t n_delete;
        do {
            n_delete = 0;
            for (auto it = derived_map_.begin(); it!=derived_map_.end(); ) {
                if (defined(it->second.parent)) {
                    ++it;
                }
                else {
                    it = derived_map_.erase(it);
                    ++n_delete;
                }
            }
        } while (n_delete>0);
    }

    // Apply a derivation to an instance of its parent.
    static hopefully<channel_ptr> apply(channel_ptr model, const std::string& name, const derivation& deriv) {
        model->set_name(name);
        const auto& info = model->info();

        for (const auto& kv: deriv.params) {
            int i = info.parameter_index(kv.first);
            if (i<0) {
                return fail(no_such_parameter(name, kv.first));
            }
            if (!info.parameters[i].second.valid(kv.second)) {
                return fail(invalid_parameter_value(name, kv.first, kv.second));
            }
            model->set(kv.first, kv.second);
        }

        // Renamings are applied simultaneously: rename through placeholders
        // so that e.g. swapping two ions is permitted.
        std::vector<std::string> ions;
        for (const auto& kv: info.ions) ions.push_back(kv.first);

        std::vector<std::string> renamed = ions;
        for (const auto& kv: deriv.ion_remap) {
            auto it = std::find(ions.begin(), ions.end(), kv.first);
            if (it==ions.end()) {
                return fail(invalid_ion_remap(name, kv.first, kv.second));
            }
            renamed[it-ions.begin()] = kv.second;
        }
        auto sorted = renamed;
        std::sort(sorted.begin(), sorted.end());
        if (std::adjacent_find(sorted.begin(), sorted.end())!=sorted.end()) {
            const auto& kv = deriv.ion_remap.front();
            return fail(invalid_ion_remap(name, kv.first, kv.second));
        }

        for (std::size_t i=0; i<ions.size(); ++i) {
            model->rename_ion(ions[i], "\x01" + std::to_string(i));
        }
        for (std::size_t i=0; i<ions.size(); ++i) {
            model->rename_ion("\x01" + std::to_string(i), renamed[i]);
        }
        return model;
    }

    // Model for channel, derived channel, or implicitly derived channel.
    hopefully<channel_ptr> instance(const std::string& name) const {
        if (const auto it = proto_map_.find(name); it!=proto_map_.end()) {
            return it->second->clone();
        }
        if (const auto it = derived_map_.find(name); it!=derived_map_.end()) {
            auto parent = instance(it->second.parent);
            if (!parent) return parent.error;
            return apply(std::move(parent.value()), name, it->second);
        }

        auto deriv = derive(name);
        if (!deriv) return deriv.error;
        auto parent = instance(deriv.value().parent);
        if (!parent) return parent.error;
        return apply(std::move(parent.value()), name, deriv.value());
    }

    // Construct derived channel based on existing parent channel and overrides.
    hopefully<derivation> derive(
        const std::string& name, const std::string& parent,
        const std::vector<std::pair<std::string, double>>& params,
        const std::vector<std::pair<std::string, std::string>>& ion_remap) const
    {
        if (defined(name)) {
            return fail(duplicate_channel(name));
        }
        if (!defined(parent)) {
            return fail(unknown_channel_error(parent));
        }

        derivation deriv{parent, params, ion_remap};

        // Validate by instantiation.
        auto base = instance(parent);
        if (!base) return base.error;
        auto check = apply(std::move(base.value()), name, deriv);
        if (!check) return check.error;

        return deriv;
    }

    // Implicit derivation.
    hopefully<derivation> derive(const std::string& name) const {
        if (defined(name)) {
            return fail(duplicate_channel(name));
        }

        auto i = name.find_last_of('/');
        if (i==std::string::npos) {
            return fail(unknown_channel_error(name));
        }

        std::string base = name.substr(0, i);
        if (!defined(base)) {
            return fail(unknown_channel_error(base));
        }

        auto base_model = instance(base);
        if (!base_model) return base_model.error;
        const auto& info = base_model.value()->info();

        bool single_ion = info.ions.size()==1u;
        auto is_ion = [&info](const std::string& name) { return info.ion_index(name)>=0; };

        std::vector<std::pair<std::string, double>> params;
        std::vector<std::pair<std::string, std::string>> ion_remap;

        std::string suffix = name.substr(i+1);
        while (!suffix.empty()) {
            std::string assign;

            auto comma = suffix.find(',');
            if (comma==std::string::npos) {
                assign = suffix;
                suffix.clear();
            }
            else {
                assign = suffix.substr(0, comma);
                suffix = suffix.substr(comma+1);
            }

            std::string k, v;
            auto eq = assign.find('=');
            if (eq==std::string::npos) {
                if (!single_ion) {
                    return fail(invalid_ion_remap(name));
                }

                k = info.ions.front().first;
                v = assign;
            }
            else {
                k = assign.substr(0, eq);
                v = assign.substr(eq+1);
            }

            if (is_ion(k)) {
                ion_remap.push_back({k, v});
            }
            else {
                char* end = nullptr;
                double v_value = std::strtod(v.c_str(), &end);
                if (v.empty() || !end || *end) {
                    return fail(invalid_parameter_value(name, k, v));
                }
                params.push_back({k, v_value});
            }
        }

        return derive(name, base, params, ion_remap);
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& kv: proto_map_) result.push_back(kv.first);
        for (const auto& kv: derived_map_) result.push_back(kv.first);
        std::sort(result.begin(), result.end());
        return result;
    }

    string_map<channel_ptr> proto_map_;
    string_map<derivation> derived_map_;
};

// Channel catalogue method implementations.

channel_catalogue::channel_catalogue():
    state_(new catalogue_state)
{}

channel_catalogue::channel_catalogue(channel_catalogue&& other) = default;
channel_catalogue& channel_catalogue::operator=(channel_catalogue&& other) = default;

channel_catalogue::channel_catalogue(const channel_catalogue& other):
    state_(new catalogue_state(*other.state_))
{}

channel_catalogue& channel_catalogue::operator=(const channel_catalogue& other) {
    if (this != &other) {
        state_.reset(new catalogue_state(*other.state_));
    }
    return *this;
}

channel_catalogue::~channel_catalogue() = default;

void channel_catalogue::add(const std::string& name, channel_ptr prototype) {
    if (state_->defined(name)) {
        throw duplicate_channel(name);
    }
    state_->bind(name, std::move(prototype));
}

bool channel_catalogue::has(const std::string& name) const {
    return state_->defined(name) || (bool)state_->derive(name);
}

bool channel_catalogue::is_derived(const std::string& name) const {
    return state_->is_derived(name);
}

channel_info channel_catalogue::operator[](const std::string& name) const {
    return value(state_->instance(name))->info();
}

void channel_catalogue::derive(const std::string& name, const std::string& parent,
    const std::vector<std::pair<std::string, double>>& params,
    const std::vector<std::pair<std::string, std::string>>& ion_remap)
{
    state_->bind(name, value(state_->derive(name, parent, params, ion_remap)));
}

void channel_catalogue::derive(const std::string& name, const std::string& parent) {
    auto deriv = value(state_->derive(parent));
    if (state_->defined(name)) {
        throw duplicate_channel(name);
    }
    state_->bind(name, std::move(deriv));
}

void channel_catalogue::remove(const std::string& name) {
    if (!state_->defined(name)) {
        throw unknown_channel_error(name);
    }
    state_->remove(name);
}

channel_ptr channel_catalogue::instance(const std::string& name) const {
    return value(state_->instance(name));
}

std::vector<std::string> channel_catalogue::names() const {
    return state_->names();
}

namespace {

channel_catalogue build_default_catalogue() {
    channel_catalogue cat;
    cat.add("leak", channels::make_leak());
    cat.add("hh", channels::make_hh());
    cat.add("cag_k", channels::make_cag_k());
    cat.add("nak_atpase", channels::make_nak_atpase());
    cat.add("ca_atpase", channels::make_ca_atpase());

    // Membrane diffusion constants [m^2/s] of the single-ion leaks.
    cat.derive("leak_na", "leak", {{"permeability", 1.0e-18}});
    cat.derive("leak_k",  "leak", {{"permeability", 15.0e-18}}, {{"na", "k"}});
    cat.derive("leak_cl", "leak", {{"permeability", 2.0e-18}}, {{"na", "cl"}});
    cat.derive("leak_ca", "leak", {{"permeability", 1.0e-18}}, {{"na", "ca"}});
    return cat;
}

} // anonymous namespace

const channel_catalogue& global_default_catalogue() {
    static channel_catalogue cat = build_default_catalogue();
    return cat;
}

} // namespace bes
