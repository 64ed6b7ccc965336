#pragma once

namespace kgnav {

// Closed set of native menu commands. Table order is menu order.
enum class MenuCommand {
    About,
    SetLayoutConceptCentric,
    SetLayoutSphere,
    SetLayoutGrid,
    ToggleXRay,
    ResetCamera,
    ToggleSidebar
};

} // namespace kgnav
