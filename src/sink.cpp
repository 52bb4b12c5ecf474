#include "peatgrid/sink.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/logging.hpp"
#include "peatgrid/writer.hpp"

#include <boost/json.hpp>

#include <system_error>

namespace peatgrid {

    GeoJsonPointSink::GeoJsonPointSink(std::filesystem::path path)
        : path_(std::move(path)), partial_(path_.string() + ".partial") {
        if (path_.has_parent_path() && !std::filesystem::is_directory(path_.parent_path())) {
            throw SinkUnavailable("GeoJsonPointSink: directory \"" + path_.parent_path().string() +
                                  "\" does not exist");
        }

        out_.open(partial_, std::ios::out | std::ios::trunc);
        if (!out_) {
            throw SinkUnavailable("GeoJsonPointSink: cannot open \"" + partial_.string() + "\" for write");
        }

        boost::json::object P;
        P["crs"] = crsName(CRS::BNG);
        out_ << R"({"type":"FeatureCollection","crs":)" << boost::json::serialize(crsToJson(CRS::BNG))
             << R"(,"properties":)" << boost::json::serialize(P) << R"(,"features":[)";
    }

    GeoJsonPointSink::~GeoJsonPointSink() {
        if (committed_) {
            return;
        }
        out_.close();
        std::error_code ec;
        std::filesystem::remove(partial_, ec);
        if (ec) {
            logger()->warn("could not remove partial output {}: {}", partial_.string(), ec.message());
        }
    }

    void GeoJsonPointSink::addPoint(const SamplePoint &point) {
        if (committed_) {
            throw SinkUnavailable("GeoJsonPointSink: point added after commit");
        }
        if (count_ > 0) {
            out_ << ",";
        }
        out_ << "\n" << boost::json::serialize(samplePointToJson(point));
        if (!out_) {
            throw SinkUnavailable("GeoJsonPointSink: write to \"" + partial_.string() + "\" failed");
        }
        ++count_;
    }

    void GeoJsonPointSink::commit() {
        if (committed_) {
            return;
        }
        out_ << "\n]}\n";
        out_.close();
        if (out_.fail()) {
            throw SinkUnavailable("GeoJsonPointSink: could not finish \"" + partial_.string() + "\"");
        }

        std::error_code ec;
        std::filesystem::rename(partial_, path_, ec);
        if (ec) {
            throw SinkUnavailable("GeoJsonPointSink: cannot move output into place at \"" + path_.string() +
                                  "\": " + ec.message());
        }
        committed_ = true;
    }

} // namespace peatgrid
