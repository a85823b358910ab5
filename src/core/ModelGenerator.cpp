/**
 * @file ModelGenerator.cpp
 * @brief Main implementation of the print model generation pipeline
 */

#include "osmprint.hpp"
#include "BoundaryClipper.hpp"
#include "FeatureClassifier.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "ModelBuilder.hpp"
#include "OsmDataLoader.hpp"
#include "Projector.hpp"
#include "ScalingCalculator.hpp"
#include <chrono>

namespace osmprint {

// ============================================================================
// ModelGenerator::Impl - Private implementation
// ============================================================================

class ModelGenerator::Impl {
public:
    explicit Impl(const PrintConfig& config)
        : config_(config),
          logger_("ModelGenerator") {

        // Wire logger to config log level
        logger_.setLogLevel(static_cast<LogLevel>(config_.log_level));
    }

    bool generate_model() {
        auto start_time = std::chrono::high_resolution_clock::now();
        metrics_ = {};
        model_.reset();

        if (!validate(true)) {
            return false;
        }

        OsmDataset dataset;
        try {
            OsmDataLoader loader;
            dataset = loader.load_file(config_.input_file);
        } catch (const OsmDataError& e) {
            logger_.error("Failed to load feature data: " + std::string(e.what()));
            return false;
        }

        auto loaded_time = std::chrono::high_resolution_clock::now();
        metrics_.data_loading_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            loaded_time - start_time);
        logger_.info("Loaded " + std::to_string(dataset.elements.size()) + " elements from " +
                     config_.input_file + " in " + std::to_string(metrics_.data_loading_time.count()) + "ms");

        bool success = run_pipeline(dataset);

        auto end_time = std::chrono::high_resolution_clock::now();
        metrics_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        if (success) {
            logger_.info("Total processing time: " + std::to_string(metrics_.total_time.count()) + "ms");
        }
        return success;
    }

    bool generate_model(const OsmDataset& dataset) {
        auto start_time = std::chrono::high_resolution_clock::now();
        metrics_ = {};
        model_.reset();

        if (!validate(false)) {
            return false;
        }

        bool success = run_pipeline(dataset);

        auto end_time = std::chrono::high_resolution_clock::now();
        metrics_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        return success;
    }

    bool has_model() const { return model_ != nullptr; }

    const SolidModel& get_model() const {
        if (!model_) {
            throw std::logic_error("No model has been generated");
        }
        return *model_;
    }

    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const PrintConfig& get_config() const { return config_; }

    void update_config(const PrintConfig& config) {
        config_ = config;
        logger_.setLogLevel(static_cast<LogLevel>(config_.log_level));
    }

private:
    PrintConfig config_;
    Logger logger_;
    PerformanceMetrics metrics_;
    std::unique_ptr<SolidModel> model_;

    bool validate(bool require_input_file) {
        InputValidator validator;
        auto validation_result = validator.validate(config_, require_input_file);
        if (validation_result.has_errors()) {
            logger_.error(validation_result.format_error_message());
            return false;
        }
        return true;
    }

    /**
     * @brief Region bounds: configuration, then the dataset's bounds, then node extent
     */
    std::optional<GeoBounds> resolve_bounds(const OsmDataset& dataset) {
        if (config_.bounds) {
            return config_.bounds;
        }
        if (dataset.bounds) {
            logger_.info("Using region bounds from the input data");
            return dataset.bounds;
        }
        auto extent = dataset.node_extent();
        if (extent) {
            logger_.warning("No region bounds given; using the extent of all nodes");
        }
        return extent;
    }

    bool run_pipeline(const OsmDataset& dataset) {
        metrics_.elements_loaded = dataset.elements.size();

        auto bounds = resolve_bounds(dataset);
        if (!bounds) {
            logger_.error("No region bounds available: give --bounds or input data with nodes");
            return false;
        }

        try {
            const Projector projector(*bounds);
            const BoundaryWindow window = BoundaryWindow::from_bounds(*bounds, projector);

            logger_.info("Region: " + std::to_string(bounds->south) + "," + std::to_string(bounds->west) +
                         " to " + std::to_string(bounds->north) + "," + std::to_string(bounds->east) +
                         " (" + std::to_string(window.width()) + "m x " + std::to_string(window.depth()) + "m)");

            ScalingCalculator scaling_calc;
            const ScalePlan plan = scaling_calc.plan(window.width(), window.depth(), config_.target_size_mm);

            auto classify_start = std::chrono::high_resolution_clock::now();
            FeatureClassifier classifier;
            const ClassificationResult classification = classifier.classify(dataset.elements);
            auto classify_end = std::chrono::high_resolution_clock::now();
            metrics_.classification_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                classify_end - classify_start);

            ModelBuilder builder;
            auto model = std::make_unique<SolidModel>(
                builder.build(classification, dataset, projector, window, plan));
            metrics_.model_building_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::high_resolution_clock::now() - classify_end);

            metrics_.pieces_generated = model->pieces.size();
            metrics_.triangles_generated = model->triangle_count();

            // Replace the previous model wholesale
            model_ = std::move(model);

        } catch (const GeometryError& e) {
            logger_.error("Model generation failed: " + std::string(e.what()));
            model_.reset();
            return false;
        }

        logger_.detailed("Classification: " + std::to_string(metrics_.classification_time.count()) +
                         "ms, model building: " + std::to_string(metrics_.model_building_time.count()) + "ms");
        return true;
    }
};

// ============================================================================
// ModelGenerator Public Interface
// ============================================================================

ModelGenerator::ModelGenerator(const PrintConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

ModelGenerator::~ModelGenerator() = default;

bool ModelGenerator::generate_model() {
    return impl_->generate_model();
}

bool ModelGenerator::generate_model(const OsmDataset& dataset) {
    return impl_->generate_model(dataset);
}

bool ModelGenerator::has_model() const {
    return impl_->has_model();
}

const SolidModel& ModelGenerator::get_model() const {
    return impl_->get_model();
}

const PerformanceMetrics& ModelGenerator::get_metrics() const {
    return impl_->get_metrics();
}

void ModelGenerator::update_config(const PrintConfig& config) {
    impl_->update_config(config);
}

const PrintConfig& ModelGenerator::get_config() const {
    return impl_->get_config();
}

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<ModelGenerator> create_generator(
    const GeoBounds& bounds,
    const std::string& input_file,
    double target_size_mm) {

    PrintConfig config;
    config.bounds = bounds;
    config.input_file = input_file;
    config.target_size_mm = target_size_mm;

    return std::make_unique<ModelGenerator>(config);
}

} // namespace osmprint
