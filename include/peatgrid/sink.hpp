#pragma once

#include "peatgrid/types.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

namespace peatgrid {

    // Receives sample points as they are produced.
    class PointSink {
      public:
        virtual ~PointSink() = default;

        virtual void addPoint(const SamplePoint &point) = 0;

        // Makes everything added so far visible as the finished output.
        virtual void commit() {}
    };

    class MemoryPointSink : public PointSink {
      public:
        void addPoint(const SamplePoint &point) override { points_.push_back(point); }
        void commit() override { committed_ = true; }

        const std::vector<SamplePoint> &points() const { return points_; }
        bool committed() const { return committed_; }

      private:
        std::vector<SamplePoint> points_;
        bool committed_ = false;
    };

    // Streams points into "<path>.partial" and renames it to path on commit. Destroying the sink without
    // committing deletes the partial file, so an aborted run leaves no output behind.
    class GeoJsonPointSink : public PointSink {
      public:
        // Throws SinkUnavailable when the partial file cannot be created.
        explicit GeoJsonPointSink(std::filesystem::path path);
        ~GeoJsonPointSink() override;

        GeoJsonPointSink(const GeoJsonPointSink &) = delete;
        GeoJsonPointSink &operator=(const GeoJsonPointSink &) = delete;

        void addPoint(const SamplePoint &point) override;
        void commit() override;

        const std::filesystem::path &path() const { return path_; }
        std::size_t count() const { return count_; }

      private:
        std::filesystem::path path_;
        std::filesystem::path partial_;
        std::ofstream out_;
        std::size_t count_ = 0;
        bool committed_ = false;
    };

} // namespace peatgrid
