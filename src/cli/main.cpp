// pinfold - reproducible package environments
//
//   pinfold env create <name> [manifest]
//   pinfold env add -e <name> <spec>...
//   pinfold env concretize [<name>]
//   pinfold env install [<name>]

#include <CLI/CLI.hpp>
#include <pinfold/commands.hpp>
#include <pinfold/log.hpp>
#include <pinfold/site.hpp>

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GlobalOptions {
    bool verbose = false;
    std::string root;
};

struct EnvOptions {
    std::string env_flag;
    std::string name;
    std::vector<std::string> specs;
    std::string manifest_file;
    bool force = false;
    bool yes = false;
    int jobs = 0;
};

std::optional<std::string> optional_of(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

pinfold::commands::EnvArgs env_args(const EnvOptions& o) {
    return {optional_of(o.env_flag), optional_of(o.name)};
}

} // namespace

int main(int argc, char** argv) {
    using namespace pinfold;

    CLI::App app{"pinfold - reproducible package environments"};
    app.require_subcommand(1);

    GlobalOptions global;
    app.add_flag("-v,--verbose", global.verbose, "Debug logging");
    app.add_option("--root", global.root, "Site root (default: $PINFOLD_ROOT or ~/.pinfold)");

    auto* env_cmd = app.add_subcommand("env", "Manage environments");
    env_cmd->require_subcommand(1);

    EnvOptions opts;
    // The command chosen on the command line, run once the site is open
    std::function<Status(const Site&)> action;

    auto* create = env_cmd->add_subcommand("create", "Create an environment");
    create->add_option("name", opts.name, "Environment name")->required();
    create->add_option("manifest", opts.manifest_file, "Initial pinfold.toml");
    create->callback([&] {
        action = [&](const Site& site) {
            return commands::create(site, optional_of(opts.name),
                                    optional_of(opts.manifest_file), std::cout);
        };
    });

    auto* destroy = env_cmd->add_subcommand("destroy", "Remove an environment");
    destroy->add_option("name", opts.name, "Environment name")->required();
    destroy->add_flag("-y,--yes", opts.yes, "Do not ask for confirmation");
    destroy->callback([&] {
        action = [&](const Site& site) -> Status {
            if (!opts.yes) {
                std::cout << "Really destroy environment '" << opts.name << "'? [y/N] ";
                std::string answer;
                std::getline(std::cin, answer);
                if (answer != "y" && answer != "Y") {
                    std::cout << "Not destroyed\n";
                    return ok_status();
                }
            }
            return commands::destroy(site, optional_of(opts.name), std::cout);
        };
    });

    auto* list = env_cmd->add_subcommand("list", "List environments");
    list->callback([&] {
        action = [&](const Site& site) { return commands::list(site, std::cout); };
    });

    auto* add = env_cmd->add_subcommand("add", "Add specs to an environment");
    add->add_option("-e,--env", opts.env_flag, "Environment name");
    add->add_option("specs", opts.specs, "Specs to add")->required();
    add->callback([&] {
        action = [&](const Site& site) {
            return commands::add(site, env_args(opts), opts.specs, std::cout);
        };
    });

    auto* remove = env_cmd->add_subcommand("remove", "Remove specs from an environment");
    remove->add_option("-e,--env", opts.env_flag, "Environment name");
    remove->add_option("specs", opts.specs, "Specs to remove")->required();
    remove->callback([&] {
        action = [&](const Site& site) {
            return commands::remove(site, env_args(opts), opts.specs, std::cout);
        };
    });

    // Commands whose only argument is the environment
    auto env_command = [&](const char* name, const char* help) {
        auto* sub = env_cmd->add_subcommand(name, help);
        sub->add_option("-e,--env", opts.env_flag, "Environment name");
        sub->add_option("name", opts.name, "Environment name");
        return sub;
    };

    auto* concretize = env_command("concretize", "Resolve the environment's specs");
    concretize->add_flag("-f,--force", opts.force, "Resolve from scratch");
    concretize->callback([&] {
        action = [&](const Site& site) {
            return commands::concretize(site, env_args(opts), opts.force, std::cout);
        };
    });

    env_command("status", "Show specs and their resolution")->callback([&] {
        action = [&](const Site& site) {
            return commands::status(site, env_args(opts), std::cout);
        };
    });

    auto* install = env_command("install", "Install every spec of the environment");
    install->add_option("-j,--jobs", opts.jobs, "Parallel installs (default: config build_jobs)");
    install->callback([&] {
        action = [&](const Site& site) {
            return commands::install(site, env_args(opts), opts.jobs, std::cout);
        };
    });

    env_command("uninstall", "Uninstall the environment's specs")->callback([&] {
        action = [&](const Site& site) {
            return commands::uninstall(site, env_args(opts), std::cout);
        };
    });

    env_command("stage", "Stage sources of every spec")->callback([&] {
        action = [&](const Site& site) {
            return commands::stage(site, env_args(opts), std::cout);
        };
    });

    env_command("loads", "Write module load lines")->callback([&] {
        action = [&](const Site& site) {
            return commands::loads(site, env_args(opts), std::cout);
        };
    });

    CLI11_PARSE(app, argc, argv);

    log::init_from_env();
    if (global.verbose) log::set_level(log::Debug);

    auto site = global.root.empty() ? Site::from_environment() : Site::open(global.root);
    if (site.is_err()) {
        std::cerr << site.error().format() << "\n";
        return 1;
    }

    if (!action) {
        std::cerr << app.help();
        return 1;
    }

    auto result = action(site.value());
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
