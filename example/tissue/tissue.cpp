/*
 * A miniapp that grows a planar cell cluster, couples it with gap junctions
 * and follows its membrane voltage under a central current stimulus.
 *
 */

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <bes/besexcept.hpp>
#include <bes/chancat.hpp>
#include <bes/common_types.hpp>
#include <bes/context.hpp>
#include <bes/geometry.hpp>
#include <bes/network.hpp>
#include <bes/region.hpp>
#include <bes/run_controller.hpp>
#include <bes/simulation.hpp>
#include <bes/tissue_parameters.hpp>

#include "parameters.hpp"

bes::geometry_parameters make_geometry_parameters(const tissue_params& params);
bes::connectivity_parameters make_connectivity_parameters(const tissue_params& params);
bes::tissue_parameters make_tissue_parameters(const tissue_params& params, const bes::tissue_geometry& geom);

// Writes voltage snapshots as a json file.
void write_snapshots_json(const std::string& name, const bes::tissue_geometry& geom, const std::vector<bes::tissue_snapshot>& snapshots);

int main(int argc, char** argv) {
    try {
        auto params = read_options(argc, argv);

        auto context = bes::make_context(bes::proc_allocation(params.threads));

        // Print a banner with information about hardware configuration
        std::cout << "threads:  " << bes::num_threads(context) << "\n" << std::endl;

        auto geom = bes::build_geometry(make_geometry_parameters(params));
        auto net = bes::build_network(geom, make_connectivity_parameters(params));

        std::cout << "cells:      " << geom.size() << "\n";
        std::cout << "junctions:  " << net.junctions.size() << "\n";
        std::cout << "boundary:   " << net.boundary.size() << " segments\n";
        std::cout << "components: " << net.num_components << "\n" << std::endl;

        bes::simulation sim(geom, net, make_tissue_parameters(params, geom),
                            bes::global_default_catalogue(), context);

        bes::run_controller controller(sim);
        controller.set_step_callback(bes::progress_bar());

        std::vector<bes::tissue_snapshot> snapshots;
        controller.set_snapshot_callback(
            [&snapshots](const bes::tissue_snapshot& s) { snapshots.push_back(s); });

        bes::run_parameters run;
        run.dt = params.dt;
        run.t_final = params.t_final;
        run.snapshot_every = params.snapshot_every;
        run.snapshot_initial = true;

        std::cout << "running simulation" << std::endl;
        auto result = controller.run(run);

        std::cout << "\n" << result.steps << " steps, status " << to_string(result.status)
                  << ", " << result.warnings << " stability warnings\n";
        if (!result.message.empty()) {
            std::cout << result.message << "\n";
        }

        double vmin = result.last.voltage.front();
        double vmax = vmin;
        for (auto v: result.last.voltage) {
            vmin = std::min(vmin, v);
            vmax = std::max(vmax, v);
        }
        std::cout << "voltage range at t=" << result.time << " s: ["
                  << vmin*1e3 << ", " << vmax*1e3 << "] mV\n";

        if (params.print_all) {
            write_snapshots_json(params.name, geom, snapshots);
        }
    }
    catch (std::exception& e) {
        std::cerr << "exception caught in tissue miniapp: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

bes::geometry_parameters make_geometry_parameters(const tissue_params& params) {
    bes::geometry_parameters p;
    p.width = params.width*1e-6;
    p.height = params.height*1e-6;
    p.cell_radius = params.cell_radius*1e-6;
    p.noise = params.noise;
    p.seed = params.seed;

    if (params.lattice=="square") p.lattice = bes::lattice_kind::square;
    else if (params.lattice=="hexagonal") p.lattice = bes::lattice_kind::hexagonal;
    else throw std::runtime_error("unknown lattice: "+params.lattice);

    if (params.crop=="rectangle") p.crop = bes::crop_shape::rectangle;
    else if (params.crop=="circle") p.crop = bes::crop_shape::circle;
    else throw std::runtime_error("unknown crop shape: "+params.crop);

    if (params.wound_radius>0) {
        bes::point centre{p.width/2, p.height/2};
        p.exclusions.push_back({centre, params.wound_radius*1e-6});
    }
    return p;
}

bes::connectivity_parameters make_connectivity_parameters(const tissue_params& params) {
    bes::connectivity_parameters p;
    if (params.coupling=="full") p.rule = bes::coupling_rule::full;
    else if (params.coupling=="random") p.rule = bes::coupling_rule::random;
    else if (params.coupling=="exclude-boundary") p.rule = bes::coupling_rule::exclude_boundary;
    else throw std::runtime_error("unknown coupling rule: "+params.coupling);

    p.probability = params.coupling_probability;
    p.permeability = params.gj_permeability;
    p.seed = params.seed;
    return p;
}

bes::tissue_parameters make_tissue_parameters(const tissue_params& params, const bes::tissue_geometry& geom) {
    bes::tissue_parameters p;
    p.verbose = params.verbose;

    if (params.scheme=="explicit_euler") p.scheme = bes::integration_scheme::explicit_euler;
    else if (params.scheme=="semi_implicit") p.scheme = bes::integration_scheme::semi_implicit;
    else throw std::runtime_error("unknown integration scheme: "+params.scheme);

    for (auto& name: params.channels) {
        p.channels.push_back({name, bes::region::all(), {}, 1.0});
    }
    if (params.hh_boundary) {
        p.channels.push_back({"hh", bes::region::boundary(), {}, 1.0});
    }

    // Stimulate the cells within two cell radii of the cluster centre.
    bes::point centre{geom.parameters.width/2, geom.parameters.height/2};
    if (params.stim_amplitude!=0 && params.stim_duration>0) {
        bes::current_stimulus stim;
        stim.where = bes::region::disc(centre, 2*geom.parameters.cell_radius);
        stim.amplitude = params.stim_amplitude;
        stim.t_on = 0;
        stim.t_off = params.stim_duration;
        p.stimuli.push_back(stim);
    }

    if (params.bath_k>0) {
        bes::bath_change change;
        change.species = "k";
        change.target = params.bath_k;
        change.profile = {params.bath_k_onset, params.t_final+1, params.dt*100};
        p.bath_changes.push_back(change);
    }

    return p;
}

void write_snapshots_json(const std::string& name, const bes::tissue_geometry& geom, const std::vector<bes::tissue_snapshot>& snapshots) {
    std::string path = "tissue_" + name + ".json";

    nlohmann::json json;
    json["name"] = "tissue demo: " + name;
    json["units"] = {{"time", "s"}, {"position", "m"}, {"voltage", "V"}};

    auto& jc = json["cells"];
    for (auto& c: geom.cells) {
        jc.push_back({{"x", c.centroid.x}, {"y", c.centroid.y}, {"volume", c.volume}});
    }

    auto& js = json["data"];
    for (auto& s: snapshots) {
        js.push_back({{"step", s.step}, {"time", s.time}, {"voltage", s.voltage}});
    }

    std::ofstream file(path);
    file << std::setw(1) << json << "\n";
    std::cout << "snapshots written to " << path << "\n";
}
