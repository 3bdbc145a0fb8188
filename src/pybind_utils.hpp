#pragma once

#include <algorithm>
#include <array>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <pybind11/iostream.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <xtensor/xtensor.hpp>

namespace py = pybind11;

template <typename T>
using PyArrayT = py::array_t<T, py::array::c_style | py::array::forcecast>;

template <typename Sequence>
inline py::array_t<typename Sequence::value_type>
as_pyarray_ref(const Sequence& seq) {
    auto size        = seq.size();
    const auto* data = seq.data();
    return py::array_t<typename Sequence::value_type>(size, data);
}

template <typename T>
inline py::list
as_listof_pyarray(const std::vector<std::vector<T>>& vec_of_vecs) {
    py::list result;
    for (const auto& inner : vec_of_vecs) {
        result.append(as_pyarray_ref(inner));
    }
    return result;
}

template <typename T, std::size_t N>
inline py::array_t<T> as_pyarray_xt(const xt::xtensor<T, N>& arr) {
    std::vector<py::ssize_t> shape(arr.shape().begin(), arr.shape().end());
    py::array_t<T> result(shape);
    std::copy(arr.begin(), arr.end(), result.mutable_data());
    return result;
}

template <typename T, std::size_t N>
inline xt::xtensor<T, N> to_xtensor(const PyArrayT<T>& arr) {
    if (arr.ndim() != static_cast<py::ssize_t>(N)) {
        throw std::invalid_argument("Array has the wrong number of dimensions");
    }
    std::array<std::size_t, N> shape{};
    for (std::size_t i = 0; i < N; ++i) {
        shape[i] = static_cast<std::size_t>(arr.shape(i));
    }
    xt::xtensor<T, N> result(shape);
    std::copy(arr.data(), arr.data() + arr.size(), result.begin());
    return result;
}

// Simple RAII wrapper for stream redirection
class StreamRedirection {
public:
    StreamRedirection()
        : m_stdout_redirect(std::cout,
                            py::module_::import("sys").attr("stdout")),
          m_stderr_redirect(std::cerr,
                            py::module_::import("sys").attr("stderr")) {}

private:
    py::scoped_ostream_redirect m_stdout_redirect;
    py::scoped_estream_redirect m_stderr_redirect;
};
