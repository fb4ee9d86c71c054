#pragma once

// Prototypes of the channel models in the default catalogue.

#include <bes/channel.hpp>

namespace bes {
namespace channels {

// Electrodiffusive (GHK) leak of a single ion; binds "na" by default.
channel_ptr make_leak();

// Hodgkin-Huxley sodium and potassium currents with a K-carried leak.
channel_ptr make_hh();

// Calcium-activated potassium channel with Hill activation.
channel_ptr make_cag_k();

// Na/K-ATPase exchanging 3 Na+ out for 2 K+ in per ATP.
channel_ptr make_nak_atpase();

// Plasma membrane Ca-ATPase.
channel_ptr make_ca_atpase();

} // namespace channels
} // namespace bes
