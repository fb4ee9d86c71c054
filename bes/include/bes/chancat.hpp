#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <bes/channel.hpp>
#include <bes/chaninfo.hpp>

// Channel catalogue maintains:
//
// 1. Prototype channel models indexed by name.
//
// 2. A hierarchy of 'derived' channels, that specialise the parameter
//    values and ion bindings of a parent.
//
// There is in addition a global default channel catalogue object that is
// populated with the built-in channel and pump models.
//
// When a channel name of the form "chan/param=value,..." is requested, if the
// channel of that name does not already exist in the catalogue, it will be
// implicitly derived from an existing channel "chan", with parameters and ion
// bindings overridden by the supplied assignments that follow the slash.
// If the channel in question has a single ion dependence, then that ion name
// can be omitted in the assignments; "chan/oldion=newion" will make the same
// derived channel as simply "chan/newion".

namespace bes {

// catalogue_state comprises the private implementation of channel_catalogue.
struct catalogue_state;

class channel_catalogue {
public:
    channel_catalogue();
    channel_catalogue(channel_catalogue&& other);
    channel_catalogue& operator=(channel_catalogue&& other);

    channel_catalogue(const channel_catalogue& other);
    channel_catalogue& operator=(const channel_catalogue& other);

    ~channel_catalogue();

    void add(const std::string& name, channel_ptr prototype);

    // Has `name` been added, derived, or can it be implicitly derived?
    bool has(const std::string& name) const;

    // Is `name` a derived channel or can it be implicitly derived?
    bool is_derived(const std::string& name) const;

    // Read-only access to channel info, reflecting any derivation.
    channel_info operator[](const std::string& name) const;

    // Construct a channel derived from an existing entry, with a sequence of
    // parameter overrides and a set of ion renamings.
    void derive(const std::string& name, const std::string& parent,
                const std::vector<std::pair<std::string, double>>& params,
                const std::vector<std::pair<std::string, std::string>>& ion_remap = {});

    // Make an implicit derivation (e.g. "leak/k") available under its own name.
    void derive(const std::string& name, const std::string& parent);

    // Remove channel from catalogue, together with any derivations of it.
    void remove(const std::string& name);

    // Fresh model for `name` with all derivation overrides applied.
    channel_ptr instance(const std::string& name) const;

    // All channel names in the catalogue, sorted.
    std::vector<std::string> names() const;

private:
    std::unique_ptr<catalogue_state> state_;
};

const channel_catalogue& global_default_catalogue();

} // namespace bes
