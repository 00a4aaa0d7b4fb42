#ifndef CODEREF_LIB_REFS_WALKER_H_
#define CODEREF_LIB_REFS_WALKER_H_

#include <refs/reference.h>
#include <refs/context.h>
#include <code/code.h>
#include <diag/diag.h>
#include <rt/rt.h>

namespace coderef::refs {

/*
 * Our goal is to find the objects a code object refers to. The names in the
 * instructions are not fully qualified: reading `foo.bar` loads `foo` and then
 * loads attribute `bar`, with nothing linking the two. We walk the instructions
 * once, keeping a single symbolic top of stack, to find out which object each
 * attribute is requested from.
 *
 * Lookups that fail are reported to the sink and dropped; the walk always
 * completes. The result keeps the order in which references were committed.
 */
reference_list extract_references(const code::code_object &code,
                                  const code_context &context,
                                  const rt::importer &modules,
                                  diag::sink &sink);

// build_context followed by extract_references; error::contract_violation propagates
reference_list references_of(const rt::value &callable, const rt::importer &modules, diag::sink &sink);

}

#endif //CODEREF_LIB_REFS_WALKER_H_
