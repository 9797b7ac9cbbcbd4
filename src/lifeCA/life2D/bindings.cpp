#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <sstream>

#include "grid.hpp"
#include "patterns.hpp"

namespace py = pybind11;

PYBIND11_MODULE(life2D_cpp, m)
{
    py::register_exception<EmptySeedError>(m, "EmptySeedError", PyExc_ValueError);

    // ---------------- Pattern ----------------
    py::class_<Pattern>(m, "Pattern")
        .def(py::init<>())
        .def_readonly("name",  &Pattern::name)
        .def_readonly("cells", &Pattern::cells);

    // copies, the built-in table stays untouched
    m.def("patterns", &builtinPatterns);
    m.def("pattern", &findPattern, py::arg("name"));
    m.def("load_pattern", &loadPatternFile, py::arg("filename"));
    m.def("save_pattern", &savePatternFile, py::arg("filename"), py::arg("grid"));

    // ---------------- Grid ----------------
    py::class_<Grid>(m, "Grid")
        .def(py::init<std::size_t, std::size_t>(),
             py::arg("width"), py::arg("height"))
        .def(py::init<
            const std::string&,
            const std::vector<std::vector<int>>&
        >(), py::arg("name"), py::arg("seed"))
        .def(py::init<const Pattern&>(), py::arg("pattern"))

        .def("set_alive", &Grid::setAlive, py::arg("points"))
        .def("step", &Grid::step)
        .def("simulate", &Grid::simulate, py::arg("max_steps"))
        .def("is_alive", &Grid::isAlive, py::arg("x"), py::arg("y"))

        .def_property_readonly("name",   &Grid::getName)
        .def_property_readonly("width",  &Grid::getWidth)
        .def_property_readonly("height", &Grid::getHeight)

        .def("shape",
             [](const Grid& g) {
                 return py::make_tuple(g.getHeight(), g.getWidth());
             })

        .def("rows",
             [](const Grid& g) {
                 py::list out;
                 for (const auto& row : g.cells()) {
                     py::list r;
                     for (bool live : row)
                         r.append(live);
                     out.append(r);
                 }
                 return out;
             })

        // ZERO-COPY read-only NumPy view, valid until the next step()
        .def("numpy",
            [](Grid& g) {
                py::array_t<uint8_t> arr(
                    {g.getHeight(), g.getWidth()},
                    {sizeof(uint8_t) * g.getWidth(), sizeof(uint8_t)},
                    g.raw().data(),
                    py::cast(&g)
                );
                arr.attr("flags").attr("writeable") = false;
                return arr;
            })

        .def("__str__",
             [](const Grid& g) {
                 std::ostringstream os;
                 os << g;
                 return os.str();
             });
}
