#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <memory>

#include "io/json_loader.hpp"
#include "taxcore/engine.h"

namespace {

void write_csv_fields(const std::string& filename, const TaxCore::TaxComputation& c) {
    std::ofstream f(filename);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open CSV output: " + filename);
    }
    f << "field,value\n";
    for (const auto& [key, value] : c.to_field_map()) {
        f << key << "," << value << "\n";
    }
    f.close();
    std::cerr << "[TaxCore::CLI] Wrote " << filename << std::endl;
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <return.json> [--rates <table.json>] [--csv <out.csv>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace TaxCore;

    std::string return_path;
    std::string rates_path;
    std::string csv_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--rates" && i + 1 < argc) {
            rates_path = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            csv_path = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && return_path.empty()) {
            return_path = arg;
        } else {
            usage(argv[0]);
            return 2;
        }
    }
    if (return_path.empty()) {
        usage(argv[0]);
        return 2;
    }

    try {
        if (!std::filesystem::exists(return_path)) {
            std::cerr << "[TaxCore::CLI] Error: return file not found: " << return_path << std::endl;
            return 1;
        }

        // 1. Load return
        TaxReturn ret = JsonLoader::load_return(return_path);

        // 2. Select rate tables
        std::shared_ptr<const TaxYearConfig> cfg = rates_path.empty()
            ? RateTables::builtin(ret.tax_year)
            : JsonLoader::load_tax_year(rates_path);
        TaxEngine engine(cfg);

        // 3. Compute
        TaxComputation result = engine.compute(ret);
        for (const auto& note : result.advisories) {
            std::cerr << "[TaxCore::CLI] Advisory: " << note << std::endl;
        }

        std::cout << JsonLoader::to_json(result).dump(2) << std::endl;

        if (!csv_path.empty()) {
            write_csv_fields(csv_path, result);
        }
        return 0;

    } catch (const ConfigurationError& e) {
        std::cerr << "[TaxCore::CLI] Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const InvalidInputError& e) {
        std::cerr << "[TaxCore::CLI] Invalid input: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[TaxCore::CLI] Error: " << e.what() << std::endl;
        return 1;
    }
}
