// src/python_bindings/binding.cpp
//
// PyBind11 bindings for the **ParallelPreferenceEngine** framework.
// Exposes the functional core (prediction, loss, gradient), the random key,
// the `OptimizationEngine` facade with its backend factory, the
// personalization flow and the fixture generators to Python.
//
// Matrices cross the boundary through <pybind11/eigen.h>: NumPy float64
// arrays convert to `Eigen::MatrixXd` arguments and results come back as
// NumPy arrays.
//
// Key bindings:
// • `RandomKey`, `split`: explicit random-state threading.
// • `predict`, `predictAll`, `meanAbsoluteError`, `maeGradient`.
// • `TrainingConfig`, `TrainingReport`, `OptimizationEngine`.
// • `create_engine(mode)`: factory over "sequential", "threadpool", "openmp"
//   and, in CUDA builds, "gpu".
// • `personalize`, `rankItems`, fixture generators.
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "Engine.hpp"
#include "Gradient.hpp"
#include "Loss.hpp"
#include "Personalization.hpp"
#include "Predictor.hpp"
#include "RandomKey.hpp"
#include "util.hpp"
namespace py = pybind11;

/**
 * @brief PyBind11 module definition: `ppe_bindings`
 */
PYBIND11_MODULE(ppe_bindings, m) {
    m.doc() = "Python bindings for ParallelPreferenceEngine";

    // Error taxonomy maps onto Python exception classes deriving RuntimeError.
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_RuntimeError);
    py::register_exception<DegenerateInputError>(m, "DegenerateInputError", PyExc_RuntimeError);
    py::register_exception<NumericAnomalyError>(m, "NumericAnomalyError", PyExc_RuntimeError);

    py::class_<RandomKey>(m, "RandomKey")
        .def(py::init<std::uint64_t>())
        .def_property_readonly("value", &RandomKey::value)
        .def("__eq__", &RandomKey::operator==);
    m.def("split", [](const RandomKey& key) {
        auto keys = split(key);
        return py::make_tuple(keys.first, keys.second);
    }, "Derive two independent keys from one");

    m.def("predict", &predict, "Dot product of one feature vector and one preference vector");
    m.def("predictAll", &predictAll, "Item x Agent predicted ratings");
    m.def("meanAbsoluteError", &meanAbsoluteError, "Mean absolute error of two rating matrices");
    m.def("maeGradient", &maeGradient, "Closed-form MAE subgradient with respect to the preferences");
    m.def("numericalGradient", &numericalGradient, py::arg("params"), py::arg("target"),
          py::arg("features"), py::arg("epsilon") = 1e-6);

    py::class_<TrainingConfig>(m, "TrainingConfig")
        .def(py::init<>())
        .def_readwrite("num_rounds", &TrainingConfig::num_rounds)
        .def_readwrite("learning_rate", &TrainingConfig::learning_rate)
        .def_readwrite("report_every", &TrainingConfig::report_every)
        .def_readwrite("verbose", &TrainingConfig::verbose);

    py::class_<TrainingReport>(m, "TrainingReport")
        .def_readonly("rounds", &TrainingReport::rounds)
        .def_readonly("time_taken", &TrainingReport::time_taken)
        .def_readonly("final_loss", &TrainingReport::final_loss)
        .def_readonly("loss_history", &TrainingReport::loss_history);

    py::class_<PersonalizationResult>(m, "PersonalizationResult")
        .def_readonly("params", &PersonalizationResult::params)
        .def_readonly("predictions", &PersonalizationResult::predictions)
        .def_readonly("report", &PersonalizationResult::report);

    // run/fit return (params, report) since the report is an out-parameter in C++.
    py::class_<OptimizationEngine>(m, "OptimizationEngine")
        .def("backend", [](OptimizationEngine& self) { return self.backend().name(); })
        .def("run", [](OptimizationEngine& self, const ParameterMatrix& params, const RatingMatrix& target,
                       const FeatureMatrix& features, const TrainingConfig& config) {
            TrainingReport report;
            ParameterMatrix fitted = self.run(params, target, features, config, report);
            return py::make_tuple(fitted, report);
        })
        .def("fit", [](OptimizationEngine& self, const RandomKey& key, const FeatureMatrix& features,
                       const RatingMatrix& target, const TrainingConfig& config) {
            TrainingReport report;
            ParameterMatrix fitted = fitPreferences(self, key, features, target, config, report);
            return py::make_tuple(fitted, report);
        })
        .def("personalize", [](OptimizationEngine& self, const RandomKey& key, const FeatureMatrix& catalog,
                               const std::vector<Index>& items, const RatingMatrix& ratings,
                               const TrainingConfig& config) {
            return personalize(self, key, catalog, items, ratings, config);
        });

    m.def("create_engine", &createEngine, py::return_value_policy::take_ownership,
          "Create an optimization engine with the named gradient backend");
    m.def("initializeParameters", &initializeParameters);
    m.def("generateItemFeatures", &generateItemFeatures, py::arg("key"), py::arg("num_items"),
          py::arg("num_features"), py::arg("p") = 0.5);
    m.def("generatePreferences", &generatePreferences);
    m.def("generateRatings", &generateRatings);
    m.def("rankItems", &rankItems, py::arg("predictions"), py::arg("agent"),
          py::arg("exclude") = std::vector<Index>());
}
