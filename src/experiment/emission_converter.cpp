#include "experiment/emission_converter.h"

#include "core/logger.h"
#include "xml/xml_scanner.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <ostream>
#include <thread>

namespace flowsim::experiment {
namespace {

constexpr std::array<std::string_view, 6> kRequiredAttributes{"id", "speed", "pos", "lane", "x", "y"};

// CSV columns taken verbatim from a vehicle attribute, after the derived
// time/edge/lane/position columns.
constexpr std::array<std::string_view, 11> kPassThroughTail{
    "angle", "CO", "CO2", "HC", "NOx", "PMx", "fuel", "electricity", "noise", "waiting", "eclass"};

void WriteCell(std::ostream& out, std::string_view value) {
    if (value.find_first_of(",\"\n\r") == std::string_view::npos) {
        out << value;
        return;
    }

    out << '"';
    for (const char ch : value) {
        if (ch == '"') {
            out << '"';
        }
        out << ch;
    }
    out << '"';
}

std::string_view AttributeOrEmpty(const xml::Event& event, std::string_view name) {
    const std::string* value = event.FindAttribute(name);
    return value != nullptr ? std::string_view(*value) : std::string_view();
}

bool HasRequiredAttributes(const xml::Event& event) {
    for (const std::string_view name : kRequiredAttributes) {
        if (event.FindAttribute(name) == nullptr) {
            return false;
        }
    }
    return true;
}

void WriteVehicleRow(std::ostream& out, std::string_view time, const xml::Event& vehicle) {
    const std::string_view lane = AttributeOrEmpty(vehicle, "lane");
    const std::size_t separator = lane.rfind('_');
    const std::string_view edge_id = separator == std::string_view::npos ? lane : lane.substr(0, separator);
    const std::string_view lane_number =
        separator == std::string_view::npos ? std::string_view() : lane.substr(separator + 1);

    WriteCell(out, time);
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "id"));
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "type"));
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "speed"));
    out << ',';
    WriteCell(out, edge_id);
    out << ',';
    WriteCell(out, lane_number);
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "pos"));
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "x"));
    out << ',';
    WriteCell(out, AttributeOrEmpty(vehicle, "y"));
    for (const std::string_view name : kPassThroughTail) {
        out << ',';
        WriteCell(out, AttributeOrEmpty(vehicle, name));
    }
    out << '\n';
}

}  // namespace

std::filesystem::path EmissionConverter::CsvPathFor(const std::filesystem::path& xml_path) {
    std::filesystem::path csv_path = xml_path;
    csv_path.replace_extension(".csv");
    return csv_path;
}

bool EmissionConverter::WaitUntilReady(
    const std::filesystem::path& xml_path,
    const EmissionReadiness& readiness,
    std::string& out_error) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(readiness.timeout_ms);
    std::uintmax_t last_size = 0;
    int stable_count = 0;

    while (true) {
        std::error_code size_error;
        const std::uintmax_t size = std::filesystem::file_size(xml_path, size_error);
        if (!size_error && size > 0) {
            stable_count = size == last_size ? stable_count + 1 : 0;
            last_size = size;
            if (stable_count >= readiness.stable_polls) {
                out_error.clear();
                return true;
            }
        } else {
            stable_count = 0;
            last_size = 0;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            out_error = last_size == 0
                ? "emission file not found: " + xml_path.string()
                : "emission file still growing after " + std::to_string(readiness.timeout_ms) +
                    " ms: " + xml_path.string();
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(readiness.poll_interval_ms));
    }
}

bool EmissionConverter::ConvertText(
    std::string_view xml_document,
    std::ostream& out_csv,
    std::size_t& out_row_count,
    std::string& out_error) {
    out_row_count = 0;
    out_csv << kCsvHeader << '\n';

    xml::Scanner scanner(xml_document);
    xml::Event event{};
    std::string current_time;
    bool saw_root = false;
    std::size_t skipped_rows = 0;

    while (scanner.Next(event, out_error)) {
        if (event.type == xml::EventType::EndOfDocument) {
            if (!saw_root) {
                out_error = "emission document has no root element";
                return false;
            }
            if (skipped_rows > 0) {
                core::Logger::Warn(
                    "emission",
                    "Skipped " + std::to_string(skipped_rows) + " incomplete vehicle record(s).");
            }
            out_error.clear();
            return true;
        }

        if (event.type != xml::EventType::StartElement) {
            if (event.name == "timestep") {
                current_time.clear();
            }
            continue;
        }

        saw_root = true;
        if (event.name == "timestep") {
            current_time = std::string(AttributeOrEmpty(event, "time"));
            continue;
        }

        if (event.name == "vehicle") {
            if (!HasRequiredAttributes(event)) {
                ++skipped_rows;
                continue;
            }
            WriteVehicleRow(out_csv, current_time, event);
            ++out_row_count;
        }
    }

    return false;
}

bool EmissionConverter::ConvertFile(
    const std::filesystem::path& xml_path,
    const std::filesystem::path& csv_path,
    std::size_t& out_row_count,
    std::string& out_error) {
    std::string document;
    if (!xml::ReadDocument(xml_path, document, out_error)) {
        return false;
    }

    std::filesystem::path temp_path = csv_path;
    temp_path += ".tmp";
    {
        std::ofstream csv_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!csv_file.is_open()) {
            out_error = "Cannot open CSV output: " + temp_path.string();
            return false;
        }

        if (!ConvertText(document, csv_file, out_row_count, out_error)) {
            csv_file.close();
            std::error_code remove_error;
            std::filesystem::remove(temp_path, remove_error);
            out_error = xml_path.string() + ": " + out_error;
            return false;
        }

        csv_file.flush();
        if (!csv_file.good()) {
            csv_file.close();
            std::error_code remove_error;
            std::filesystem::remove(temp_path, remove_error);
            out_error = "Failed to write CSV output: " + temp_path.string();
            return false;
        }
    }

    std::error_code rename_error;
    std::filesystem::rename(temp_path, csv_path, rename_error);
    if (rename_error) {
        std::error_code remove_error;
        std::filesystem::remove(temp_path, remove_error);
        out_error = "Failed to move CSV output into place: " + rename_error.message();
        return false;
    }

    out_error.clear();
    return true;
}

bool EmissionConverter::ConvertAndRemove(
    const std::filesystem::path& xml_path,
    const EmissionReadiness& readiness,
    std::filesystem::path& out_csv_path,
    std::string& out_error) {
    if (!WaitUntilReady(xml_path, readiness, out_error)) {
        return false;
    }

    const std::filesystem::path csv_path = CsvPathFor(xml_path);
    std::size_t row_count = 0;
    if (!ConvertFile(xml_path, csv_path, row_count, out_error)) {
        return false;
    }

    std::error_code remove_error;
    if (!std::filesystem::remove(xml_path, remove_error) || remove_error) {
        out_error = "Converted emission file but could not delete " + xml_path.string() +
            (remove_error ? ": " + remove_error.message() : std::string());
        return false;
    }

    core::Logger::Info(
        "emission",
        "Wrote " + std::to_string(row_count) + " emission row(s) to " + csv_path.string() + ".");
    out_csv_path = csv_path;
    out_error.clear();
    return true;
}

}  // namespace flowsim::experiment
