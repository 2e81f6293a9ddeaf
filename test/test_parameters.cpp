// test_parameters.cpp
// Author: Jason Hughes
// Date:   2026
//
// PipelineParameters defaults, YAML loading and eager validation.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <glog/logging.h>

#include "lesion_prep/errors.hpp"
#include "lesion_prep/parameters.hpp"
#include "test_utils.hpp"

using namespace LesionPrep;
using LesionPrepTest::expectThrows;

static std::string writeTempYaml(const std::string& name, const std::string& body)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path.string();
}

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);

    // -----------------------------------------------------------------------
    // Defaults
    // -----------------------------------------------------------------------
    std::cout << "defaults\n";
    PipelineParameters defaults;
    CHECK_EQ(defaults.target_height, 128);
    CHECK_EQ(defaults.target_width,  128);
    CHECK_EQ(defaults.clip_min, -5.0f);
    CHECK_EQ(defaults.clip_max,  5.0f);
    CHECK_EQ(defaults.out_min,   0.0f);
    CHECK_EQ(defaults.out_max,   1.0f);
    CHECK(defaults.bgr_input);

    // -----------------------------------------------------------------------
    // Explicit values and validation
    // -----------------------------------------------------------------------
    std::cout << "explicit values\n";
    PipelineParameters custom(64, 96, -3.0f, 3.0f, -1.0f, 1.0f);
    CHECK_EQ(custom.target_height, 64);
    CHECK_EQ(custom.target_width,  96);
    CHECK_EQ(custom.clip_max, 3.0f);
    CHECK_EQ(custom.out_min, -1.0f);
    CHECK(custom.bgr_input);

    PipelineParameters rgb(64, 96, -3.0f, 3.0f, -1.0f, 1.0f, false);
    CHECK(!rgb.bgr_input);
    CHECK_EQ(rgb.target_width, 96);

    expectThrows<InvalidRangeError>(
        [] { PipelineParameters(128, 128, 5.0f, -5.0f, 0.0f, 1.0f); }, "reversed clip range");
    expectThrows<InvalidRangeError>(
        [] { PipelineParameters(128, 128, 2.0f, 2.0f, 0.0f, 1.0f); }, "empty clip range");
    expectThrows<InvalidRangeError>(
        [] { PipelineParameters(128, 128, -5.0f, 5.0f, 1.0f, 1.0f); }, "empty output range");
    expectThrows<InvalidGeometryError>(
        [] { PipelineParameters(0, 128, -5.0f, 5.0f, 0.0f, 1.0f); }, "zero height");
    expectThrows<InvalidGeometryError>(
        [] { PipelineParameters(128, -4, -5.0f, 5.0f, 0.0f, 1.0f); }, "negative width");

    // Both derive from the common base
    expectThrows<PreprocessError>(
        [] { validateRange(1.0f, 0.0f, "range"); }, "validateRange via base class");

    // -----------------------------------------------------------------------
    // YAML
    // -----------------------------------------------------------------------
    std::cout << "yaml\n";
    std::string full = writeTempYaml("lesion_prep_full.yaml",
        "target_resolution: [256, 192]\n"
        "clip_range: [-3.0, 4.0]\n"
        "output_range: [-1.0, 1.0]\n"
        "bgr_input: false\n");
    PipelineParameters loaded(full);
    CHECK_EQ(loaded.target_height, 256);
    CHECK_EQ(loaded.target_width,  192);
    CHECK_EQ(loaded.clip_min, -3.0f);
    CHECK_EQ(loaded.clip_max,  4.0f);
    CHECK_EQ(loaded.out_min,  -1.0f);
    CHECK_EQ(loaded.out_max,   1.0f);
    CHECK(!loaded.bgr_input);

    std::string partial = writeTempYaml("lesion_prep_partial.yaml",
        "target_resolution: [64, 64]\n");
    PipelineParameters partial_params(partial);
    CHECK_EQ(partial_params.target_height, 64);
    CHECK_EQ(partial_params.clip_min, -5.0f);
    CHECK_EQ(partial_params.out_max,   1.0f);
    CHECK(partial_params.bgr_input);

    std::string bad_range = writeTempYaml("lesion_prep_bad_range.yaml",
        "clip_range: [5.0, -5.0]\n");
    expectThrows<InvalidRangeError>(
        [&] { PipelineParameters p(bad_range); }, "yaml reversed clip range");

    std::string bad_shape = writeTempYaml("lesion_prep_bad_shape.yaml",
        "output_range: [0.0, 1.0, 2.0]\n");
    expectThrows<std::runtime_error>(
        [&] { PipelineParameters p(bad_shape); }, "yaml three-element range");

    expectThrows<std::runtime_error>(
        [] { PipelineParameters p("/nonexistent/lesion_prep.yaml"); }, "missing yaml file");

    std::cout << "toString: " << defaults.toString() << "\n";
    std::cout << "All parameter tests passed.\n";
    return 0;
}
