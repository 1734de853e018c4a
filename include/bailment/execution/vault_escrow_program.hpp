#pragma once

#include <bailment/execution/invoke_context.hpp>
#include <bailment/schema/transaction_error_code.hpp>

// Custody vault and escrow agreement state machines.
namespace bailment::execution::vault_escrow_program {

bailment::schema::transaction_error_code process(instruction_context& context);

}  // namespace bailment::execution::vault_escrow_program
