#include "spqrbind_python.hpp"
#include "models/enums.hpp"

void init_enums(py::module_ &m) {
    py::enum_<OrderingMethod>(m, "OrderingMethod")
        .value("FIXED", OrderingMethod::Fixed)
        .value("NATURAL", OrderingMethod::Natural)
        .value("COLAMD", OrderingMethod::COLAMD)
        .value("GIVEN", OrderingMethod::Given)
        .value("CHOLMOD", OrderingMethod::CHOLMOD)
        .value("AMD", OrderingMethod::AMD)
        .value("METIS", OrderingMethod::METIS)
        .value("DEFAULT", OrderingMethod::Default)
        .value("BEST", OrderingMethod::Best)
        .value("BESTAMD", OrderingMethod::BestAMD)
        .export_values();

    py::enum_<PermutationOwnership>(m, "PermutationOwnership")
        .value("RETAINED", PermutationOwnership::Retained)
        .value("RELEASED", PermutationOwnership::Released);
}
