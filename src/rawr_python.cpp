#include "pybind_utils.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "rawr/rawr.hpp"

namespace rawr {
using algorithms::BeamSet;
using algorithms::ExampleResult;
using algorithms::RawrSearch;
using model::BagOfEmbeddingsClassifier;
using model::EmbeddingGrads;
using model::ModelBackend;
using pipelines::RawrEntry;
using pipelines::RawrPipeline;
using saliency::GradientSaliency;
using saliency::SaliencyScorer;
using search::RawrSearchConfig;

namespace py = pybind11;

namespace {

std::vector<Sequence> to_vector(std::span<const Sequence> xs) {
    return {xs.begin(), xs.end()};
}

// Lets Python classes implement the model backend
class PyModelBackend : public ModelBackend {
public:
    using ModelBackend::ModelBackend;

    std::vector<LabelType> predict(std::span<const Sequence> xs) override {
        return call("predict", to_vector(xs)).cast<std::vector<LabelType>>();
    }

    std::vector<std::vector<float>>
    predict_proba(std::span<const Sequence> xs) override {
        return call("predict_proba", to_vector(xs))
            .cast<std::vector<std::vector<float>>>();
    }

    EmbeddingGrads embedding_grads(std::span<const Sequence> xs,
                                   std::span<const LabelType> ys) override {
        const auto out =
            call("embedding_grads", to_vector(xs),
                 std::vector<LabelType>(ys.begin(), ys.end()))
                .cast<py::tuple>();
        if (out.size() != 3) {
            throw std::runtime_error("embedding_grads must return a tuple "
                                     "(loss, embeddings, grads)");
        }
        EmbeddingGrads result{.loss = out[0].cast<float>()};
        for (const auto& e : out[1].cast<py::list>()) {
            result.embeddings.push_back(
                to_xtensor<float, 2>(e.cast<PyArrayT<float>>()));
        }
        for (const auto& g : out[2].cast<py::list>()) {
            result.grads.push_back(
                to_xtensor<float, 2>(g.cast<PyArrayT<float>>()));
        }
        return result;
    }

    SizeType get_nclasses() const override {
        PYBIND11_OVERRIDE_PURE(SizeType, ModelBackend, get_nclasses);
    }

private:
    template <typename... Args>
    py::object call(const char* name, Args&&... args) const {
        py::gil_scoped_acquire gil;
        const py::function override =
            py::get_override(static_cast<const ModelBackend*>(this), name);
        if (!override) {
            throw std::runtime_error(
                std::string("ModelBackend subclass must implement ") + name);
        }
        return override(std::forward<Args>(args)...);
    }
};

py::dict as_pydict(const ExampleResult& result) {
    py::list reductions;
    for (const auto& r : result.get_reductions()) {
        reductions.append(py::make_tuple(as_pyarray_ref(r.tokens),
                                         as_pyarray_ref(r.removed_indices)));
    }
    py::dict out;
    out["original_prediction"] = result.get_original_prediction();
    out["original_length"]     = result.get_original_length();
    out["best_length"]         = result.get_best_length();
    out["reductions"]          = reductions;
    return out;
}

} // namespace

PYBIND11_MODULE(librawr, m) {
    m.doc() = "Python bindings for the rawr library";

    py::add_ostream_redirect(m, "ostream_redirect");

    auto m_configs = m.def_submodule("configs", "Configs submodule");
    py::class_<RawrSearchConfig>(m_configs, "RawrSearchConfig")
        .def(py::init<SizeType, SizeType, std::optional<SizeType>, int, int,
                      bool>(),
             py::arg("max_beam_size") = kDefaultMaxBeamSize,
             py::arg("batch_size")    = kDefaultBatchSize,
             py::arg("max_batches")   = std::nullopt,
             py::arg("nthreads") = 1, py::arg("device") = -1,
             py::arg("use_lsh") = false)
        .def_property_readonly("max_beam_size",
                               &RawrSearchConfig::get_max_beam_size)
        .def_property_readonly("batch_size", &RawrSearchConfig::get_batch_size)
        .def_property_readonly("max_batches",
                               &RawrSearchConfig::get_max_batches)
        .def_property_readonly("nthreads", &RawrSearchConfig::get_nthreads)
        .def_property_readonly("device", &RawrSearchConfig::get_device)
        .def_property_readonly("use_lsh", &RawrSearchConfig::get_use_lsh)
        .def("nbatches", &RawrSearchConfig::get_nbatches, py::arg("nbatches"));

    auto m_model = m.def_submodule("model", "Model backends submodule");
    py::class_<ModelBackend, PyModelBackend>(m_model, "ModelBackend")
        .def(py::init<>())
        .def("predict",
             [](ModelBackend& self, const std::vector<Sequence>& xs) {
                 return self.predict(xs);
             },
             py::arg("xs"))
        .def("predict_proba",
             [](ModelBackend& self, const std::vector<Sequence>& xs) {
                 return as_listof_pyarray(self.predict_proba(xs));
             },
             py::arg("xs"))
        .def("embedding_grads",
             [](ModelBackend& self, const std::vector<Sequence>& xs,
                const std::vector<LabelType>& ys) {
                 const auto out = self.embedding_grads(xs, ys);
                 py::list embeddings;
                 py::list grads;
                 for (SizeType i = 0; i < out.embeddings.size(); ++i) {
                     embeddings.append(as_pyarray_xt(out.embeddings[i]));
                     grads.append(as_pyarray_xt(out.grads[i]));
                 }
                 return py::make_tuple(out.loss, embeddings, grads);
             },
             py::arg("xs"), py::arg("ys"))
        .def("get_nclasses", &ModelBackend::get_nclasses)
        .def_property_readonly("nclasses", &ModelBackend::get_nclasses);

    py::class_<BagOfEmbeddingsClassifier, ModelBackend>(
        m_model, "BagOfEmbeddingsClassifier")
        .def(py::init([](const PyArrayT<float>& embed,
                         const PyArrayT<float>& weight,
                         const PyArrayT<float>& bias, int nthreads) {
                 return std::make_unique<BagOfEmbeddingsClassifier>(
                     to_xtensor<float, 2>(embed), to_xtensor<float, 2>(weight),
                     to_xtensor<float, 1>(bias), nthreads);
             }),
             py::arg("embed"), py::arg("weight"), py::arg("bias"),
             py::arg("nthreads") = 1)
        .def_static("from_file", &BagOfEmbeddingsClassifier::from_file,
                    py::arg("filepath"), py::arg("nthreads") = 1)
        .def_property_readonly("vocab_size",
                               &BagOfEmbeddingsClassifier::get_vocab_size)
        .def_property_readonly("embed_dim",
                               &BagOfEmbeddingsClassifier::get_embed_dim)
        .def("logits",
             [](const BagOfEmbeddingsClassifier& self, const Sequence& x) {
                 return as_pyarray_xt(self.logits(x));
             },
             py::arg("x"));

    auto m_saliency = m.def_submodule("saliency", "Saliency submodule");
    py::class_<SaliencyScorer>(m_saliency, "SaliencyScorer")
        .def(
            "score",
            [](SaliencyScorer& self, const std::vector<Sequence>& xs,
               const std::vector<LabelType>& ys) {
                return as_listof_pyarray(self.score(xs, ys));
            },
            py::arg("xs"), py::arg("ys") = std::vector<LabelType>{});
    py::class_<GradientSaliency, SaliencyScorer>(m_saliency,
                                                 "GradientSaliency")
        .def(py::init<ModelBackend&>(), py::arg("model"),
             py::keep_alive<1, 2>());

    auto m_search = m.def_submodule("search", "Reduction search submodule");
    py::class_<RawrSearch>(m_search, "RawrSearch")
        .def(py::init<ModelBackend&, SaliencyScorer&, SizeType>(),
             py::arg("model"), py::arg("scorer"),
             py::arg("max_beam_size") = kDefaultMaxBeamSize,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def_property_readonly("max_beam_size",
                               &RawrSearch::get_max_beam_size)
        .def(
            "execute",
            [](RawrSearch& self, const std::vector<Sequence>& xs) {
                py::list out;
                for (const auto& result : self.execute(xs)) {
                    out.append(as_pydict(result));
                }
                return out;
            },
            py::arg("xs"));

    m_search.def(
        "remove_one",
        [](SaliencyScorer& scorer, const std::vector<Sequence>& xs,
           SizeType max_beam_size) {
            const auto beams = algorithms::remove_one(
                scorer, BeamSet::from_sequences(xs), max_beam_size);
            py::list out;
            for (const auto& example : beams.get_examples()) {
                py::list children;
                for (const auto& beam : example.get_beams()) {
                    children.append(py::make_tuple(
                        as_pyarray_ref(beam.tokens),
                        as_pyarray_ref(beam.indices),
                        as_pyarray_ref(beam.removed)));
                }
                out.append(children);
            }
            return out;
        },
        py::arg("scorer"), py::arg("xs"),
        py::arg("max_beam_size") = kDefaultMaxBeamSize);

    m_search.def(
        "get_rawr",
        [](ModelBackend& model, const std::vector<Sequence>& xs,
           SizeType max_beam_size) {
            py::list out;
            for (const auto& result :
                 algorithms::get_rawr(model, xs, max_beam_size)) {
                out.append(as_pydict(result));
            }
            return out;
        },
        py::arg("model"), py::arg("xs"),
        py::arg("max_beam_size") = kDefaultMaxBeamSize);

    auto m_pipelines = m.def_submodule("pipelines", "Pipelines submodule");
    py::class_<RawrEntry>(m_pipelines, "RawrEntry")
        .def_readonly("original_input", &RawrEntry::original_input)
        .def_readonly("reduced_input", &RawrEntry::reduced_input)
        .def_readonly("original_prediction", &RawrEntry::original_prediction)
        .def_readonly("reduced_prediction", &RawrEntry::reduced_prediction)
        .def_readonly("original_scores", &RawrEntry::original_scores)
        .def_readonly("reduced_scores", &RawrEntry::reduced_scores)
        .def_readonly("removed_indices", &RawrEntry::removed_indices)
        .def_readonly("label", &RawrEntry::label);
    py::class_<RawrPipeline>(m_pipelines, "RawrPipeline")
        .def(py::init<const RawrSearchConfig&, ModelBackend&, bool>(),
             py::arg("cfg"), py::arg("model"), py::arg("show_progress") = true,
             py::keep_alive<1, 3>())
        .def(
            "process_batch",
            [](RawrPipeline& self, const std::vector<Sequence>& xs,
               const std::vector<LabelType>& labels) {
                return self.process_batch(xs, labels);
            },
            py::arg("xs"), py::arg("labels"))
        .def(
            "execute",
            [](RawrPipeline& self, const std::vector<Sequence>& xs,
               const std::vector<LabelType>& labels,
               const std::filesystem::path& outfile) {
                StreamRedirection redirect;
                const auto dataset =
                    data::SequenceDataset::from_sequences(xs, labels);
                return self.execute(dataset, outfile);
            },
            py::arg("xs"), py::arg("labels"), py::arg("outfile"));
}

} // namespace rawr
