#include <iostream>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <bes/common_types.hpp>

#include <sup/json_params.hpp>

struct tissue_params {
    tissue_params() = default;

    std::string name = "default";

    // Geometry [µm].
    double width = 200;
    double height = 200;
    double cell_radius = 5;
    std::string lattice = "hexagonal";
    std::string crop = "rectangle";
    double noise = 0.1;
    bes::seed_type seed = bes::default_seed;
    double wound_radius = 0;

    // Connectivity.
    std::string coupling = "full";
    double coupling_probability = 1;
    double gj_permeability = 1e-3;

    // Membrane.
    std::vector<std::string> channels = {"leak_na", "leak_k", "leak_cl", "nak_atpase"};
    bool hh_boundary = false;
    std::string scheme = "explicit_euler";

    // Stimulus of the central cells [A/m²], [s].
    double stim_amplitude = 0.05;
    double stim_duration = 0.01;

    // Potassium bath raise [mol/m³] over [s].
    double bath_k = 0;
    double bath_k_onset = 0.05;

    // Run control [s].
    double dt = 1e-5;
    double t_final = 0.1;
    unsigned snapshot_every = 1000;
    unsigned threads = 1;
    bool verbose = false;
    bool print_all = true;
};

tissue_params read_options(int argc, char** argv) {
    using sup::param_from_json;

    tissue_params params;
    if (argc<2) {
        std::cout << "Using default parameters.\n";
        return params;
    }
    if (argc>2) {
        throw std::runtime_error("More than one command line option is not permitted.");
    }

    std::string fname = argv[1];
    std::cout << "Loading parameters from file: " << fname << "\n";
    std::ifstream f(fname);

    if (!f.good()) {
        throw std::runtime_error("Unable to open input parameter file: "+fname);
    }

    nlohmann::json json;
    f >> json;

    param_from_json(params.name, "name", json);
    param_from_json(params.width, "width", json);
    param_from_json(params.height, "height", json);
    param_from_json(params.cell_radius, "cell-radius", json);
    param_from_json(params.lattice, "lattice", json);
    param_from_json(params.crop, "crop", json);
    param_from_json(params.noise, "noise", json);
    param_from_json(params.seed, "seed", json);
    param_from_json(params.wound_radius, "wound-radius", json);
    param_from_json(params.coupling, "coupling", json);
    param_from_json(params.coupling_probability, "coupling-probability", json);
    param_from_json(params.gj_permeability, "gj-permeability", json);
    param_from_json(params.channels, "channels", json);
    param_from_json(params.hh_boundary, "hh-boundary", json);
    param_from_json(params.scheme, "scheme", json);
    param_from_json(params.stim_amplitude, "stim-amplitude", json);
    param_from_json(params.stim_duration, "stim-duration", json);
    param_from_json(params.bath_k, "bath-k", json);
    param_from_json(params.bath_k_onset, "bath-k-onset", json);
    param_from_json(params.dt, "dt", json);
    param_from_json(params.t_final, "t-final", json);
    param_from_json(params.snapshot_every, "snapshot-every", json);
    param_from_json(params.threads, "threads", json);
    param_from_json(params.verbose, "verbose", json);
    param_from_json(params.print_all, "print-all", json);

    if (!json.empty()) {
        for (auto it=json.begin(); it!=json.end(); ++it) {
            std::cout << "  Warning: unused input parameter: \"" << it.key() << "\"\n";
        }
        std::cout << "\n";
    }

    return params;
}
