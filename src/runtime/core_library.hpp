#ifndef PARENS_RUNTIME_CORE_LIBRARY_HPP
#define PARENS_RUNTIME_CORE_LIBRARY_HPP

namespace parens {

class module_;

// Define the Core procedures in the given module.
void
export_core_library(module_&);

} // namespace parens

#endif
