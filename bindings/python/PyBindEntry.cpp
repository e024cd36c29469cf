#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "keycap-core/Analyzer.hpp"
#include "keycap-core/Vector3.hpp"
#include "keycap-core/cad/Pipeline.hpp"

#include <array>

namespace py = pybind11;

namespace kc = keycap::core;
namespace kcad = keycap::core::cad;

namespace {

// Failed results surface in Python as ValueError("CODE: message")
template<typename T>
T unwrap(const kcad::Result<T>& result) {
    if (!result.success) {
        throw py::value_error(result.errorCode + ": " + result.errorMessage);
    }
    return result.value;
}

std::vector<std::array<double, 3>> vertexArray(const kc::Mesh& mesh) {
    std::vector<std::array<double, 3>> out;
    out.reserve(mesh.getVertexCount());
    for (const auto& v : mesh.getVertices()) {
        out.push_back({v.x, v.y, v.z});
    }
    return out;
}

std::vector<std::array<int, 3>> triangleArray(const kc::Mesh& mesh) {
    std::vector<std::array<int, 3>> out;
    out.reserve(mesh.getTriangleCount());
    for (const auto& f : mesh.getFaces()) {
        out.push_back({f.v0, f.v1, f.v2});
    }
    return out;
}

} // anonymous namespace

PYBIND11_MODULE(keycap_core_py, m) {
    m.doc() = "keycap-core: parametric keycap solid modeling";

    // Vector3 class
    py::class_<kc::Vector3>(m, "Vector3")
        .def(py::init<>())
        .def(py::init<double, double, double>())
        .def_readwrite("x", &kc::Vector3::x)
        .def_readwrite("y", &kc::Vector3::y)
        .def_readwrite("z", &kc::Vector3::z)
        .def("length", &kc::Vector3::length, "Get vector length/magnitude")
        .def("__repr__", [](const kc::Vector3& v) {
            return "Vector3(" + std::to_string(v.x) + ", " +
                   std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
        });

    // Enumerations
    py::enum_<kcad::KeyWidth>(m, "KeyWidth")
        .value("U1", kcad::KeyWidth::U1)
        .value("U1_25", kcad::KeyWidth::U1_25)
        .value("U1_5", kcad::KeyWidth::U1_5)
        .value("U1_75", kcad::KeyWidth::U1_75)
        .value("U2", kcad::KeyWidth::U2)
        .value("U2_25", kcad::KeyWidth::U2_25)
        .value("U2_75", kcad::KeyWidth::U2_75)
        .value("U6", kcad::KeyWidth::U6)
        .value("U6_25", kcad::KeyWidth::U6_25)
        .value("U7", kcad::KeyWidth::U7);

    py::enum_<kcad::ProfileFamily>(m, "ProfileFamily")
        .value("CHERRY", kcad::ProfileFamily::Cherry)
        .value("OEM", kcad::ProfileFamily::OEM)
        .value("SA", kcad::ProfileFamily::SA);

    py::enum_<kcad::ProfileRow>(m, "ProfileRow")
        .value("R1", kcad::ProfileRow::R1)
        .value("R2", kcad::ProfileRow::R2)
        .value("R3", kcad::ProfileRow::R3)
        .value("R4", kcad::ProfileRow::R4);

    py::enum_<kcad::StemType>(m, "StemType")
        .value("CHERRY_MX", kcad::StemType::CherryMX)
        .value("NONE", kcad::StemType::None);

    py::enum_<kcad::Severity>(m, "Severity")
        .value("INFO", kcad::Severity::Info)
        .value("WARNING", kcad::Severity::Warning)
        .value("ERROR", kcad::Severity::Error);

    // String parsing
    m.def("parse_key_width", [](const std::string& s) { return unwrap(kcad::parseKeyWidth(s)); },
          "Parse '1', '1.25', '2.25U', ...", py::arg("text"));
    m.def("parse_profile_family", [](const std::string& s) { return unwrap(kcad::parseProfileFamily(s)); },
          "Parse 'CHERRY' / 'OEM' / 'SA'", py::arg("text"));
    m.def("parse_profile_row", [](const std::string& s) { return unwrap(kcad::parseProfileRow(s)); },
          "Parse 'R1'..'R4'", py::arg("text"));
    m.def("parse_stem_type", [](const std::string& s) { return unwrap(kcad::parseStemType(s)); },
          "Parse 'CHERRY_MX' / 'NONE'", py::arg("text"));

    // KeycapParameters struct
    py::class_<kcad::KeycapParameters>(m, "KeycapParameters")
        .def(py::init<>())
        .def_readwrite("width", &kcad::KeycapParameters::width)
        .def_readwrite("profile_family", &kcad::KeycapParameters::profileFamily)
        .def_readwrite("profile_row", &kcad::KeycapParameters::profileRow)
        .def_readwrite("bevel_radius", &kcad::KeycapParameters::bevelRadius,
                      "Edge rounding radius, [0, 2] mm")
        .def_readwrite("stem_type", &kcad::KeycapParameters::stemType)
        .def_readwrite("wall_thickness", &kcad::KeycapParameters::wallThickness,
                      "Shell wall thickness, (0, 6] mm")
        .def("footprint_width", &kcad::KeycapParameters::footprintWidth)
        .def("footprint_depth", &kcad::KeycapParameters::footprintDepth)
        .def("__repr__", [](const kcad::KeycapParameters& p) {
            return "KeycapParameters(" + kcad::toString(p.width) + ", " +
                   kcad::toString(p.profileFamily) + " " + kcad::toString(p.profileRow) +
                   ", bevel=" + std::to_string(p.bevelRadius) +
                   " mm, stem=" + kcad::toString(p.stemType) +
                   ", wall=" + std::to_string(p.wallThickness) + " mm)";
        });

    // Mesh class
    py::class_<kc::Mesh, std::shared_ptr<kc::Mesh>>(m, "Mesh")
        .def("vertices", &vertexArray, "Vertex positions as [[x, y, z], ...] (mm)")
        .def("triangles", &triangleArray, "Counter-clockwise vertex index triples")
        .def("get_volume", &kc::Mesh::getVolume, "Enclosed volume (mm³)")
        .def("is_watertight", &kc::Mesh::isWatertight)
        .def("get_bounding_box", &kc::Mesh::getBoundingBox,
             "Bounding box dimensions as Vector3(width, depth, height)")
        .def("get_vertex_count", &kc::Mesh::getVertexCount)
        .def("get_triangle_count", &kc::Mesh::getTriangleCount);

    py::class_<kcad::Diagnostic>(m, "Diagnostic")
        .def_readonly("severity", &kcad::Diagnostic::severity)
        .def_readonly("code", &kcad::Diagnostic::code)
        .def_readonly("stage", &kcad::Diagnostic::stage)
        .def_readonly("message", &kcad::Diagnostic::message)
        .def("__repr__", [](const kcad::Diagnostic& d) {
            return "Diagnostic(" + kcad::toString(d.severity) + ", " + d.stage +
                   ", " + d.code + ": " + d.message + ")";
        });

    // Pipeline class
    auto toPy = [](const kcad::Result<kcad::MeshPtr>& r) {
        return std::const_pointer_cast<kc::Mesh>(unwrap(r));
    };

    py::class_<kcad::Pipeline>(m, "Pipeline")
        .def(py::init([](const kcad::KeycapParameters& params) {
            return new kcad::Pipeline(params);
        }), py::arg("params") = kcad::KeycapParameters())
        .def_property_readonly("parameters", &kcad::Pipeline::parameters)
        .def("set_parameters", [toPy](kcad::Pipeline& p, const kcad::KeycapParameters& params) {
            return toPy(p.setParameters(params));
        }, py::arg("params"))
        .def("set_width", [toPy](kcad::Pipeline& p, kcad::KeyWidth w) {
            return toPy(p.setWidth(w));
        }, py::arg("width"))
        .def("set_profile", [toPy](kcad::Pipeline& p, kcad::ProfileFamily f, kcad::ProfileRow r) {
            return toPy(p.setProfile(f, r));
        }, py::arg("family"), py::arg("row"))
        .def("set_bevel_radius", [toPy](kcad::Pipeline& p, double r) {
            return toPy(p.setBevelRadius(r));
        }, py::arg("radius"))
        .def("set_stem_type", [toPy](kcad::Pipeline& p, kcad::StemType s) {
            return toPy(p.setStemType(s));
        }, py::arg("stem"))
        .def("set_wall_thickness", [toPy](kcad::Pipeline& p, double t) {
            return toPy(p.setWallThickness(t));
        }, py::arg("thickness"))
        .def("evaluate", [toPy](kcad::Pipeline& p) { return toPy(p.evaluate()); },
             "Re-run changed stages and return the preview mesh")
        .def("bake", [toPy](kcad::Pipeline& p) { return toPy(p.bake()); },
             "Tessellate the final keycap into the exportable mesh")
        .def("is_baked", &kcad::Pipeline::isBaked)
        .def("effective_wall_thickness", &kcad::Pipeline::effectiveWallThickness)
        .def("diagnostics", &kcad::Pipeline::diagnostics)
        .def("last_run_stages", &kcad::Pipeline::lastRunStages)
        .def("on_diagnostic", &kcad::Pipeline::onDiagnostic, py::arg("callback"));

    // Analyzer class
    py::class_<kc::WallThicknessReport>(m, "WallThicknessReport")
        .def(py::init<>())
        .def_readwrite("min_thickness", &kc::WallThicknessReport::minThickness,
                      "Thinnest wall found (mm)")
        .def_readwrite("sampled_vertices", &kc::WallThicknessReport::sampledVertices)
        .def_readwrite("thin_vertex_count", &kc::WallThicknessReport::thinVertexCount,
                      "Samples below the threshold")
        .def("__repr__", [](const kc::WallThicknessReport& r) {
            return "WallThicknessReport(min_thickness=" + std::to_string(r.minThickness) +
                   " mm, thin_vertices=" + std::to_string(r.thinVertexCount) + ")";
        });

    py::class_<kc::Analyzer>(m, "Analyzer")
        .def(py::init([](std::shared_ptr<kc::Mesh> mesh) {
            return new kc::Analyzer(std::move(mesh));
        }), py::arg("mesh"))
        .def("get_volume", &kc::Analyzer::getVolume,
             "Calculate the volume of the mesh")
        .def("is_watertight", &kc::Analyzer::isWatertight,
             "Check if the mesh is watertight (manifold)")
        .def("get_component_count", &kc::Analyzer::getComponentCount)
        .def("build_spatial_index", &kc::Analyzer::buildSpatialIndex,
             "Build spatial acceleration structure for ray queries")
        .def("measure_wall_thickness", &kc::Analyzer::measureWallThickness,
             "Inward ray thickness over the mesh vertices",
             py::arg("thin_threshold_mm") = 0.91,
             py::arg("sample_stride") = 1)
        .def("probe_up", [](const kc::Analyzer& a, double x, double y) -> py::object {
            kc::RayHit hit = a.probeUp(x, y);
            if (!hit.hit) {
                return py::none();
            }
            return py::cast(hit.point.z);
        },"Height of the first surface above (x, y), or None", py::arg("x"), py::arg("y"));
}
