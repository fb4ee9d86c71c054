#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/chancat.hpp>
#include <bes/channel.hpp>
#include <bes/context.hpp>
#include <bes/region.hpp>
#include <bes/simulation.hpp>
#include <bes/tissue_state.hpp>

#include "execution_context.hpp"
#include "io/trace.hpp"
#include "threading/threading.hpp"
#include "util/double_buffer.hpp"
#include "util/pprintf.hpp"

namespace bes {

using util::pprintf;

namespace {

// Number of cells or junctions per task.
constexpr int batch_size = 64;

} // anonymous namespace

std::string to_string(simulation_status s) {
    switch (s) {
    case simulation_status::uninitialized: return "uninitialized";
    case simulation_status::ready:         return "ready";
    case simulation_status::stepping:      return "stepping";
    case simulation_status::converged:     return "converged";
    case simulation_status::diverged:      return "diverged";
    case simulation_status::finalized:     return "finalized";
    }
    return "unknown";
}

// Channel attachment resolved against the tissue.
struct channel_instance {
    channel_ptr model;
    std::string channel;
    std::vector<cell_index_type> cells;
    double density = 1;

    // Species index and write permission of each ion slot.
    std::vector<int> species;
    std::vector<char> write_flux;

    // Channel blocks acting on the instance: index into
    // tissue_parameters::channel_blocks and the affected cells (by position
    // in `cells`).
    std::vector<std::pair<std::size_t, std::vector<char>>> blocks;
};

struct stimulus_target {
    std::vector<char> mask;     // per cell
    int species = 0;
    double flux_density = 0;    // [mol/(m^2 s)] into the cell
    double t_on = 0;
    double t_off = 0;
};

// Junction with its geometric coupling P·A/L [m].
struct junction_coupling {
    cell_index_type a = 0;
    cell_index_type b = 0;
    double coupling = 0;
};

class simulation_state {
public:
    simulation_state(const tissue_geometry& geom,
                     const tissue_network& net,
                     const tissue_parameters& params,
                     const channel_catalogue& catalogue,
                     const execution_context& ctx);

    simulation_status step(time_type dt);

    void finalize();

    void reset();

    simulation_status status() const { return status_; }
    const tissue_state& state() const { return state_.get(); }
    std::size_t warnings() const { return warnings_; }

private:
    // Time dependent environment.
    double temperature_at(time_type t) const;
    double bath_at(std::size_t species, time_type t) const;
    double junction_scale(time_type t) const;
    double block_scale(const channel_instance& inst, std::size_t k, time_type t) const;

    membrane_context local_context(const tissue_state& st, cell_index_type c, const channel_instance& inst,
                                   time_type t, double temperature) const;

    double gate_junction(double g, double dv, time_type dt) const;

    tissue_state make_initial_state(const tissue_geometry& geom, const tissue_network& net);

    // Description of the first violated stability condition in `st`, or
    // the empty string.
    std::string check_stability(const tissue_state& st, std::size_t n_clamped);

    // Apply a functional to each index in [0, n) in parallel.
    template <typename L>
    void foreach_index(std::size_t n, L&& fn) {
        threading::parallel_for::apply(0, (int)n, batch_size, task_system_.get(), std::forward<L>(fn));
    }

    tissue_parameters params_;
    task_system_handle task_system_;

    std::size_t n_ = 0;     // cells
    std::size_t ns_ = 0;    // species
    std::size_t nj_ = 0;    // junctions

    std::vector<double> volume_;
    std::vector<double> area_;
    std::vector<double> capacitance_;

    std::vector<int> charge_;
    std::vector<double> diffusivity_;
    std::vector<double> base_bath_;

    std::vector<junction_coupling> junctions_;
    std::vector<std::vector<std::size_t>> adjacency_;

    std::vector<channel_instance> instances_;

    // (instance, position in instance cells) for each cell.
    std::vector<std::vector<std::pair<std::size_t, std::size_t>>> cell_instances_;

    std::vector<stimulus_target> stimuli_;

    std::shared_ptr<const tissue_layout> layout_;
    tissue_state initial_;

    // The current state is get(); a step is computed into other() and
    // committed by exchange() once it passes the stability check.
    util::double_buffer<tissue_state> state_;

    // Per step work space.
    std::vector<double> membrane_flux_;     // [species*n + cell] [mol/s]
    std::vector<double> junction_flux_;     // [junction*ns + species] a→b [mol/s]
    std::vector<char> clamped_;
    std::vector<unsigned> clamp_warnings_;

    simulation_status status_ = simulation_status::uninitialized;
    std::size_t warnings_ = 0;
    unsigned clamp_run_ = 0;
};

simulation_state::simulation_state(
        const tissue_geometry& geom,
        const tissue_network& net,
        const tissue_parameters& params,
        const channel_catalogue& catalogue,
        const execution_context& ctx
    ):
    params_(params),
    task_system_(ctx.thread_pool)
{
    validate(params_);

    if (net.num_cells!=geom.size()) {
        throw bad_parameters(pprintf("network describes {} cells, geometry {}", net.num_cells, geom.size()));
    }

    n_ = geom.size();
    ns_ = params_.species.size();
    nj_ = net.junctions.size();

    const auto& constants = params_.constants;
    for (auto& c: geom.cells) {
        volume_.push_back(c.volume);
        area_.push_back(c.membrane_area);
        capacitance_.push_back(constants.membrane_capacitance*c.membrane_area);
    }

    for (auto& s: params_.species) {
        charge_.push_back(s.charge);
        diffusivity_.push_back(s.diffusivity);
        base_bath_.push_back(s.default_ext_concentration);
    }

    const double cell_height = geom.parameters.cell_height;
    for (auto& j: net.junctions) {
        junctions_.push_back({j.a, j.b, j.permeability*j.contact_length*cell_height/j.distance});
    }
    adjacency_ = net.adjacency;

    auto layout = std::make_shared<tissue_layout>();
    layout->num_cells = n_;
    layout->num_junctions = nj_;
    for (auto& s: params_.species) {
        layout->species.push_back(s.name);
    }

    // Resolve channel attachments.
    cell_instances_.resize(n_);
    for (auto& a: params_.channels) {
        channel_instance inst;
        inst.model = catalogue.instance(a.channel);
        for (auto& kv: a.parameters) {
            inst.model->set(kv.first, kv.second);
        }
        inst.channel = a.channel;
        inst.density = a.density;
        inst.cells = thingify(a.where, geom, net);

        const auto& info = inst.model->info();
        if (info.ions.size()>max_channel_ions) {
            throw bes_internal_error(pprintf("channel {} binds {} ions, more than {}", a.channel, info.ions.size(), max_channel_ions));
        }
        if (info.gates.size()>max_channel_gates) {
            throw bes_internal_error(pprintf("channel {} has {} gates, more than {}", a.channel, info.gates.size(), max_channel_gates));
        }
        for (auto& ion: info.ions) {
            int s = find_species(params_.species, ion.first);
            if (s<0) {
                throw unknown_ion_error(a.channel, ion.first);
            }
            inst.species.push_back(s);
            inst.write_flux.push_back(ion.second.write_flux);
        }

        for (std::size_t b=0; b<params_.channel_blocks.size(); ++b) {
            const auto& block = params_.channel_blocks[b];
            if (block.channel!=a.channel) continue;

            auto blocked = thingify(block.where, geom, net);
            std::vector<char> mask(inst.cells.size());
            for (std::size_t k=0; k<inst.cells.size(); ++k) {
                mask[k] = std::binary_search(blocked.begin(), blocked.end(), inst.cells[k]);
            }
            inst.blocks.emplace_back(b, std::move(mask));
        }

        tissue_layout::instance_layout il;
        il.channel = a.channel;
        il.cells = inst.cells;
        for (auto& g: info.gates) {
            il.gate_names.push_back(g.name);
        }
        layout->instances.push_back(std::move(il));

        auto i = instances_.size();
        for (std::size_t k=0; k<inst.cells.size(); ++k) {
            cell_instances_[inst.cells[k]].emplace_back(i, k);
        }
        instances_.push_back(std::move(inst));
    }

    for (auto& block: params_.channel_blocks) {
        auto attached = std::any_of(params_.channels.begin(), params_.channels.end(),
            [&block](const channel_attachment& a) { return a.channel==block.channel; });
        if (!attached) {
            throw bad_parameters(pprintf("channel block refers to channel {} which is not attached", block.channel));
        }
    }

    for (auto& stim: params_.stimuli) {
        stimulus_target target;
        target.mask.assign(n_, 0);
        for (auto c: thingify(stim.where, geom, net)) {
            target.mask[c] = 1;
        }
        target.species = find_species(params_.species, stim.ion);
        target.flux_density = stim.amplitude/(charge_[target.species]*constants.faraday);
        target.t_on = stim.t_on;
        target.t_off = stim.t_off;
        stimuli_.push_back(std::move(target));
    }

    layout_ = std::move(layout);
    initial_ = make_initial_state(geom, net);
    state_.get() = initial_;
    state_.other() = initial_;

    membrane_flux_.assign(ns_*n_, 0);
    junction_flux_.assign(nj_*ns_, 0);
    clamped_.assign(n_, 0);
    clamp_warnings_.assign(n_, 0);

    if (params_.verbose) {
        std::size_t n_inst = 0;
        for (auto& inst: instances_) n_inst += inst.cells.size();
        DEBUG << pprintf("simulation: {} cells, {} junctions, {} species, {} channel instances, {} integration",
                         n_, nj_, ns_, n_inst, to_string(params_.scheme));
    }

    status_ = simulation_status::ready;
}

double simulation_state::temperature_at(time_type t) const {
    double T = params_.temperature;
    for (auto& change: params_.temperature_changes) {
        T += change.delta*change.profile(t);
    }
    return T;
}

double simulation_state::bath_at(std::size_t species, time_type t) const {
    const double base = base_bath_[species];
    double c = base;
    for (auto& change: params_.bath_changes) {
        if (change.species==params_.species[species].name) {
            c += (change.target - base)*change.profile(t);
        }
    }
    return std::max(c, 0.0);
}

double simulation_state::junction_scale(time_type t) const {
    double scale = 1;
    for (auto& block: params_.junction_blocks) {
        scale *= 1 - block.strength*block.profile(t);
    }
    return scale;
}

double simulation_state::block_scale(const channel_instance& inst, std::size_t k, time_type t) const {
    double scale = 1;
    for (auto& b: inst.blocks) {
        if (b.second[k]) {
            const auto& block = params_.channel_blocks[b.first];
            scale *= 1 - block.strength*block.profile(t);
        }
    }
    return scale;
}

membrane_context simulation_state::local_context(
    const tissue_state& st, cell_index_type c, const channel_instance& inst,
    time_type t, double temperature) const
{
    membrane_context ctx;
    ctx.v = st.voltage_[c];
    ctx.temperature = temperature;
    ctx.time = t;
    ctx.constants = params_.constants;

    for (std::size_t i=0; i<inst.species.size(); ++i) {
        auto s = inst.species[i];
        ctx.c_in[i] = st.concentration_[s*n_ + c];
        ctx.c_out[i] = st.bath_[s];
        ctx.charge[i] = charge_[s];
    }
    return ctx;
}

// Relax the open fraction toward its voltage dependent target. The target
// is fully open up to the threshold and closes monotonically above it.
double simulation_state::gate_junction(double g, double dv, time_type dt) const {
    const auto& p = params_.junctions;
    if (!p.voltage_gated) return 1;

    double g_inf = 1;
    if (dv>p.threshold) {
        g_inf = p.min_open_fraction + (1 - p.min_open_fraction)*std::exp(-(dv - p.threshold)/p.slope);
    }
    if (p.tau==0) return g_inf;

    return g_inf + (g - g_inf)*std::exp(-dt/p.tau);
}

tissue_state simulation_state::make_initial_state(const tissue_geometry& geom, const tissue_network& net) {
    tissue_state st(layout_);

    st.step_ = 0;
    st.time_ = 0;
    st.temperature_ = temperature_at(0);

    for (std::size_t s=0; s<ns_; ++s) {
        std::fill_n(st.concentration_.begin() + s*n_, n_, params_.species[s].default_int_concentration);
    }

    for (auto& patch: params_.concentrations) {
        auto s = find_species(params_.species, patch.species);
        for (auto c: thingify(patch.where, geom, net)) {
            st.concentration_[s*n_ + c] = patch.value;
        }
        if (patch.bath) {
            base_bath_[s] = *patch.bath;
        }
    }

    for (std::size_t s=0; s<ns_; ++s) {
        st.bath_[s] = bath_at(s, 0);
    }

    // Capacitive voltage of the initial charge imbalance, offset by the
    // resting voltage reference.
    const double F = params_.constants.faraday;
    const double v_rest = params_.initial_voltage.value_or(0);
    for (std::size_t c=0; c<n_; ++c) {
        double q = 0;
        for (std::size_t s=0; s<ns_; ++s) {
            q += charge_[s]*st.concentration_[s*n_ + c];
        }
        st.voltage_[c] = v_rest + F*volume_[c]*q/capacitance_[c];
    }

    for (std::size_t i=0; i<instances_.size(); ++i) {
        auto& inst = instances_[i];
        auto ng = inst.model->num_gates();
        for (std::size_t k=0; k<inst.cells.size(); ++k) {
            auto ctx = local_context(st, inst.cells[k], inst, 0, st.temperature_);
            inst.model->init_gates(ctx, st.gates_[i].data() + k*ng);
        }
    }

    std::fill(st.open_fraction_.begin(), st.open_fraction_.end(), 1.0);
    std::fill(st.membrane_current_.begin(), st.membrane_current_.end(), 0.0);
    return st;
}

simulation_status simulation_state::step(time_type dt) {
    switch (status_) {
    case simulation_status::ready:
    case simulation_status::stepping:
    case simulation_status::converged:
        break;
    default:
        throw bad_simulation_state(pprintf("cannot step a simulation in state {}", to_string(status_)));
    }
    if (!(dt>0) || !std::isfinite(dt)) {
        throw bad_parameters(pprintf("time step {} s must be positive", dt));
    }

    const tissue_state& cur = state_.get();
    tissue_state& next = state_.other();

    const time_type t = cur.time_;
    const double T = temperature_at(t);
    const double F = params_.constants.faraday;

    // 1. Membrane currents: net transmembrane molar flux per species and cell.
    foreach_index(n_, [&](int c) {
        std::array<double, max_channel_ions> flux;

        for (std::size_t s=0; s<ns_; ++s) {
            membrane_flux_[s*n_ + c] = 0;
        }
        for (auto& [i, k]: cell_instances_[c]) {
            auto& inst = instances_[i];
            auto ctx = local_context(cur, c, inst, t, T);
            const double* g = cur.gates_[i].data() + k*inst.model->num_gates();

            inst.model->fluxes(ctx, g, flux.data());

            double scale = inst.density*block_scale(inst, k, t)*area_[c];
            for (std::size_t slot=0; slot<inst.species.size(); ++slot) {
                if (inst.write_flux[slot]) {
                    membrane_flux_[inst.species[slot]*n_ + c] += scale*flux[slot];
                }
            }
        }
        for (auto& stim: stimuli_) {
            if (stim.mask[c] && t>=stim.t_on && t<stim.t_off) {
                membrane_flux_[stim.species*n_ + c] += stim.flux_density*area_[c];
            }
        }

        double q = 0;
        for (std::size_t s=0; s<ns_; ++s) {
            q += charge_[s]*membrane_flux_[s*n_ + c];
        }
        next.membrane_current_[c] = F*q/area_[c];
    });

    // 2. Gating update, clamped to the declared gate domains.
    const bool relax = params_.scheme==integration_scheme::semi_implicit;
    foreach_index(n_, [&](int c) {
        std::array<double, max_channel_gates> dg, inf, tau;

        for (auto& [i, k]: cell_instances_[c]) {
            auto& inst = instances_[i];
            auto ng = inst.model->num_gates();
            if (!ng) continue;

            auto ctx = local_context(cur, c, inst, t, T);
            const double* g = cur.gates_[i].data() + k*ng;
            double* g_next = next.gates_[i].data() + k*ng;

            if (relax && inst.model->steady_state(ctx, g, inf.data(), tau.data())) {
                for (std::size_t j=0; j<ng; ++j) {
                    g_next[j] = inf[j] + (g[j] - inf[j])*std::exp(-dt/tau[j]);
                }
            }
            else {
                dg.fill(0);
                inst.model->gating_derivative(ctx, g, dg.data());
                for (std::size_t j=0; j<ng; ++j) {
                    g_next[j] = g[j] + dt*dg[j];
                }
            }

            const auto& gates = inst.model->info().gates;
            for (std::size_t j=0; j<ng; ++j) {
                g_next[j] = std::clamp(g_next[j], gates[j].lower_bound, gates[j].upper_bound);
            }
        }
    });

    // 3. Gap junction exchange and junction gating.
    const double vt = params_.constants.thermal_voltage(T);
    const double jscale = junction_scale(t);
    foreach_index(nj_, [&](int j) {
        const auto& jn = junctions_[j];
        const double g = cur.open_fraction_[j]*jscale*jn.coupling;
        const double dv = cur.voltage_[jn.a] - cur.voltage_[jn.b];

        for (std::size_t s=0; s<ns_; ++s) {
            const double ca = cur.concentration_[s*n_ + jn.a];
            const double cb = cur.concentration_[s*n_ + jn.b];
            const double drive = (ca - cb) + charge_[s]*0.5*(ca + cb)*dv/vt;
            junction_flux_[j*ns_ + s] = g*diffusivity_[s]*drive;
        }

        next.open_fraction_[j] = gate_junction(cur.open_fraction_[j], std::abs(dv), dt);
    });

    // 4. Concentration integration with non-negativity clamp.
    const double clamp_tol = params_.stability.clamp_tolerance;
    foreach_index(n_, [&](int c) {
        clamped_[c] = 0;
        clamp_warnings_[c] = 0;

        for (std::size_t s=0; s<ns_; ++s) {
            double net = membrane_flux_[s*n_ + c];
            for (auto j: adjacency_[c]) {
                const double f = junction_flux_[j*ns_ + s];
                net += junctions_[j].a==(cell_index_type)c? -f: f;
            }

            const double inc = dt*net/volume_[c];
            double c_next = cur.concentration_[s*n_ + c] + inc;
            if (c_next<0) {
                clamped_[c] = 1;
                if (-c_next>clamp_tol*std::abs(inc)) {
                    ++clamp_warnings_[c];
                }
                c_next = 0;
            }
            next.concentration_[s*n_ + c] = c_next;
        }
    });

    // 5. Voltage closure from the applied change in charge.
    foreach_index(n_, [&](int c) {
        double dq = 0;
        for (std::size_t s=0; s<ns_; ++s) {
            dq += charge_[s]*(next.concentration_[s*n_ + c] - cur.concentration_[s*n_ + c]);
        }
        next.voltage_[c] = cur.voltage_[c] + F*volume_[c]*dq/capacitance_[c];
    });

    // 6. Stability check; commit only a stable step.
    std::size_t n_clamped = 0;
    for (std::size_t c=0; c<n_; ++c) {
        n_clamped += clamped_[c];
        warnings_ += clamp_warnings_[c];
    }

    auto reason = check_stability(next, n_clamped);
    if (!reason.empty()) {
        status_ = simulation_status::diverged;
        DEBUG << pprintf("simulation diverged in step {} at t = {} s: {}", cur.step_+1, t+dt, reason);
        throw divergence_error(cur.step_+1, t+dt, reason);
    }

    next.step_ = cur.step_ + 1;
    next.time_ = t + dt;
    next.temperature_ = temperature_at(next.time_);
    for (std::size_t s=0; s<ns_; ++s) {
        next.bath_[s] = bath_at(s, next.time_);
    }

    double max_dv = 0;
    for (std::size_t c=0; c<n_; ++c) {
        max_dv = std::max(max_dv, std::abs(next.voltage_[c] - cur.voltage_[c]));
    }

    state_.exchange();

    const double tol = params_.stability.steady_state_tolerance;
    status_ = tol>0 && max_dv/dt<tol? simulation_status::converged: simulation_status::stepping;
    return status_;
}

std::string simulation_state::check_stability(const tissue_state& st, std::size_t n_clamped) {
    const auto& p = params_.stability;

    for (std::size_t c=0; c<n_; ++c) {
        if (!std::isfinite(st.voltage_[c])) {
            return pprintf("non-finite voltage in cell {}", c);
        }
        if (std::abs(st.voltage_[c])>p.voltage_bound) {
            return pprintf("voltage {} V in cell {} exceeds bound {} V", st.voltage_[c], c, p.voltage_bound);
        }
    }

    for (std::size_t s=0; s<ns_; ++s) {
        for (std::size_t c=0; c<n_; ++c) {
            if (!std::isfinite(st.concentration_[s*n_ + c])) {
                return pprintf("non-finite {} concentration in cell {}", layout_->species[s], c);
            }
        }
    }

    for (std::size_t i=0; i<instances_.size(); ++i) {
        for (auto g: st.gates_[i]) {
            if (!std::isfinite(g)) {
                return pprintf("non-finite gating variable of channel {}", instances_[i].channel);
            }
        }
    }

    for (std::size_t j=0; j<nj_; ++j) {
        if (!std::isfinite(st.open_fraction_[j])) {
            return pprintf("non-finite open fraction of junction {}", j);
        }
    }

    if (n_ && n_clamped>p.clamp_cell_fraction*n_) {
        ++clamp_run_;
    }
    else {
        clamp_run_ = 0;
    }
    if (clamp_run_>p.clamp_step_limit) {
        return pprintf("concentrations clamped in {} of {} cells for {} consecutive steps", n_clamped, n_, clamp_run_);
    }

    return {};
}

void simulation_state::finalize() {
    switch (status_) {
    case simulation_status::ready:
    case simulation_status::stepping:
    case simulation_status::converged:
    case simulation_status::finalized:
        status_ = simulation_status::finalized;
        break;
    default:
        throw bad_simulation_state(pprintf("cannot finalize a simulation in state {}", to_string(status_)));
    }
}

void simulation_state::reset() {
    state_.get() = initial_;
    state_.other() = initial_;
    warnings_ = 0;
    clamp_run_ = 0;
    status_ = simulation_status::ready;
}

// simulation methods: forward to simulation_state.

simulation::simulation(
    const tissue_geometry& geom,
    const tissue_network& net,
    const tissue_parameters& params,
    const channel_catalogue& catalogue,
    context ctx)
{
    impl_.reset(new simulation_state(geom, net, params, catalogue, *ctx));
}

simulation::simulation(simulation&&) = default;

simulation::~simulation() = default;

simulation_status simulation::step(time_type dt) {
    return impl_->step(dt);
}

void simulation::finalize() {
    impl_->finalize();
}

void simulation::reset() {
    impl_->reset();
}

simulation_status simulation::status() const {
    return impl_->status();
}

double simulation::voltage(cell_index_type c) const {
    return impl_->state().voltage(c);
}

double simulation::concentration(std::size_t species, cell_index_type c) const {
    return impl_->state().concentration(species, c);
}

tissue_snapshot simulation::snapshot() const {
    return impl_->state().snapshot();
}

std::size_t simulation::stability_warnings() const {
    return impl_->warnings();
}

time_type simulation::time() const {
    return impl_->state().time();
}

step_type simulation::num_steps() const {
    return impl_->state().step();
}

} // namespace bes
