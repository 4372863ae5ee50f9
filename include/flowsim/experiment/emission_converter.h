#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace flowsim::experiment {

struct EmissionReadiness final {
    int timeout_ms = 10000;
    int poll_interval_ms = 20;
    // Consecutive polls with an unchanged, non-zero size.
    int stable_polls = 3;
};

// Converts the backend's per-timestep emission XML into one CSV row per
// (time, vehicle).
class EmissionConverter final {
public:
    static constexpr std::string_view kCsvHeader =
        "time,id,type,speed,edge_id,lane_number,relative_position,x,y,angle,"
        "CO,CO2,HC,NOx,PMx,fuel,electricity,noise,waiting,eclass";

    static std::filesystem::path CsvPathFor(const std::filesystem::path& xml_path);

    static bool WaitUntilReady(
        const std::filesystem::path& xml_path,
        const EmissionReadiness& readiness,
        std::string& out_error);

    static bool ConvertText(
        std::string_view xml_document,
        std::ostream& out_csv,
        std::size_t& out_row_count,
        std::string& out_error);

    // Writes through a temporary file renamed into place.
    static bool ConvertFile(
        const std::filesystem::path& xml_path,
        const std::filesystem::path& csv_path,
        std::size_t& out_row_count,
        std::string& out_error);

    // Waits for the file, converts it next to the source and deletes the
    // source on success.
    static bool ConvertAndRemove(
        const std::filesystem::path& xml_path,
        const EmissionReadiness& readiness,
        std::filesystem::path& out_csv_path,
        std::string& out_error);
};

}  // namespace flowsim::experiment
