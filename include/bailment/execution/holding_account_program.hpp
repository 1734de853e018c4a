#pragma once

#include <bailment/execution/invoke_context.hpp>
#include <bailment/schema/transaction_error_code.hpp>

// Creates the canonical holding account of an (owner, mint) pair.
namespace bailment::execution::holding_account_program {

bailment::schema::transaction_error_code process(instruction_context& context);

}  // namespace bailment::execution::holding_account_program
