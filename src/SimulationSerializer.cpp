#include "SimulationSerializer.h"
#include "JsonText.h"
#include <fstream>
#include <stdexcept>

// Helper to quote a CSV field when it contains a separator or a quote
static std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char ch : s) {
        if (ch == '"')
            out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

void SimulationSerializer::serialize(const Market& market, const SimulationResult& result, std::ostream& out) {
    out << "{\n";
    out << "  \"config\": " << result.config.to_json() << ",\n";
    out << "  \"market\": " << market.to_json() << ",\n";
    out << "  \"cancelled\": " << (result.cancelled ? "true" : "false") << ",\n";
    out << "  \"sampled_coverage\": "
        << (result.sampled_coverage ? json_number(*result.sampled_coverage) : std::string("null")) << ",\n";
    out << "  \"summary\": " << result.summary.to_json() << ",\n";
    out << "  \"runs\": [\n";
    for (size_t i = 0; i < result.runs.size(); ++i) {
        out << "    " << result.runs[i].to_json();
        if (i + 1 < result.runs.size()) out << ",";
        out << "\n";
    }
    out << "  ]\n";
    out << "}";
}

void SimulationSerializer::write_search_results(const SimulationResult& result, std::ostream& out) {
    out << "run,search,latitude,longitude,postal_code,eligible,bids,connected,"
           "contractor_id,distance_km,cleaner_score\n";
    for (const RunInfo& run : result.runs) {
        for (const SearchOutcome& o : run.outcomes) {
            const Bid* c = o.connection();
            out << run.run << ","
                << o.search_index << ","
                << json_number(o.point.latitude) << ","
                << json_number(o.point.longitude) << ","
                << csv_field(o.postal_code) << ","
                << o.offers.size() << ","
                << o.bids.size() << ","
                << (c ? 1 : 0) << ","
                << (c ? csv_field(c->contractor_id) : std::string()) << ","
                << (c ? json_number(c->distance) : std::string()) << ","
                << (c ? json_number(c->cleaner_score) : std::string()) << "\n";
        }
    }
}

void SimulationSerializer::save(const Market& market, const SimulationResult& result, const std::string& directory) {
    std::string base = directory.empty() || directory.back() == '/' ? directory : directory + "/";

    std::ofstream summary(base + "simulation_summary.json");
    if (!summary)
        throw std::runtime_error("cannot write " + base + "simulation_summary.json");
    serialize(market, result, summary);
    summary << "\n";

    std::ofstream searches(base + "search_results.csv");
    if (!searches)
        throw std::runtime_error("cannot write " + base + "search_results.csv");
    write_search_results(result, searches);

    if (!summary || !searches)
        throw std::runtime_error("error while writing results to " + directory);
}
