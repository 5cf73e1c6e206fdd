#include "bank_functions.hpp"
#include "bank_directory.hpp"
#include "bank_inferrer.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace nuban {

// Loads the bank list, honouring ignore_errors
static std::vector<BankRecord> LoadBanks(const std::string &function_name, bool ignore_errors) {
    auto list = BankDirectory::GetInstance().ListBanks();
    if (!list.ok()) {
        if (ignore_errors) {
            return std::vector<BankRecord>();
        }
        throw IOException("%s: %s (%s)", function_name, list.error, BankListStatusToString(list.status));
    }
    return list.banks;
}

static bool ParseIgnoreErrors(TableFunctionBindInput &input) {
    for (auto &kv : input.named_parameters) {
        if (kv.first == "ignore_errors" && !kv.second.IsNull()) {
            return BooleanValue::Get(kv.second);
        }
    }
    return false;
}

// ========== nuban_banks() ==========

struct BanksBindData : public TableFunctionData {
    bool ignore_errors = false;
};

struct BanksGlobalState : public GlobalTableFunctionState {
    std::vector<BankRecord> banks;
    idx_t offset = 0;

    idx_t MaxThreads() const override {
        return 1;
    }
};

static unique_ptr<FunctionData> BanksBind(ClientContext &context, TableFunctionBindInput &input,
                                          vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<BanksBindData>();
    bind_data->ignore_errors = ParseIgnoreErrors(input);

    names.emplace_back("name");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("code");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("long_code");
    return_types.emplace_back(LogicalType::VARCHAR);

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> BanksInit(ClientContext &context, TableFunctionInitInput &input) {
    auto &bind_data = input.bind_data->Cast<BanksBindData>();
    auto result = make_uniq<BanksGlobalState>();
    result->banks = LoadBanks("nuban_banks", bind_data.ignore_errors);
    return std::move(result);
}

static void BanksFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
    auto &state = data_p.global_state->Cast<BanksGlobalState>();

    idx_t count = 0;
    while (state.offset < state.banks.size() && count < STANDARD_VECTOR_SIZE) {
        auto &bank = state.banks[state.offset];

        output.SetValue(0, count, Value(bank.name));
        output.SetValue(1, count, Value(bank.code));
        output.SetValue(2, count, Value(bank.long_code));

        state.offset++;
        count++;
    }

    output.SetCardinality(count);
}

// ========== nuban_infer_banks(account) ==========

struct InferBanksBindData : public TableFunctionData {
    std::string account_number;
    bool ignore_errors = false;
};

struct InferBanksGlobalState : public GlobalTableFunctionState {
    std::vector<InferredBank> matches;
    idx_t offset = 0;

    idx_t MaxThreads() const override {
        return 1;
    }
};

static unique_ptr<FunctionData> InferBanksBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<InferBanksBindData>();

    if (input.inputs.empty() || input.inputs[0].IsNull()) {
        throw BinderException("nuban_infer_banks requires an account number");
    }
    bind_data->account_number = StringValue::Get(input.inputs[0]);
    bind_data->ignore_errors = ParseIgnoreErrors(input);

    names.emplace_back("name");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("code");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("long_code");
    return_types.emplace_back(LogicalType::VARCHAR);

    names.emplace_back("matched_code");
    return_types.emplace_back(LogicalType::VARCHAR);

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> InferBanksInit(ClientContext &context, TableFunctionInitInput &input) {
    auto &bind_data = input.bind_data->Cast<InferBanksBindData>();
    auto result = make_uniq<InferBanksGlobalState>();

    auto banks = LoadBanks("nuban_infer_banks", bind_data.ignore_errors);
    result->matches = InferBanks(bind_data.account_number, banks);

    return std::move(result);
}

static void InferBanksFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
    auto &state = data_p.global_state->Cast<InferBanksGlobalState>();

    idx_t count = 0;
    while (state.offset < state.matches.size() && count < STANDARD_VECTOR_SIZE) {
        auto &match = state.matches[state.offset];

        output.SetValue(0, count, Value(match.bank.name));
        output.SetValue(1, count, Value(match.bank.code));
        output.SetValue(2, count, Value(match.bank.long_code));
        output.SetValue(3, count, Value(match.matched_code));

        state.offset++;
        count++;
    }

    output.SetCardinality(count);
}

// ========== Bank source configuration ==========

// nuban_set_bank_source(source VARCHAR) -> VARCHAR
static void NubanSetBankSourceFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) -> string_t {
            std::string source = input.GetString();
            BankDirectory::GetInstance().SetSource(source);
            return StringVector::AddString(result, "Bank source set to: " + source);
        });
}

// nuban_get_bank_source() -> VARCHAR
static void NubanGetBankSourceFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    std::string source = BankDirectory::GetInstance().GetSource();
    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    auto result_data = ConstantVector::GetData<string_t>(result);
    result_data[0] = StringVector::AddString(result, source);
}

void RegisterBankFunctions(ExtensionLoader &loader) {
    TableFunction banks_function("nuban_banks", {}, BanksFunction, BanksBind, BanksInit);
    banks_function.named_parameters["ignore_errors"] = LogicalType::BOOLEAN;
    loader.RegisterFunction(banks_function);

    TableFunction infer_function("nuban_infer_banks", {LogicalType::VARCHAR}, InferBanksFunction, InferBanksBind,
                                 InferBanksInit);
    infer_function.named_parameters["ignore_errors"] = LogicalType::BOOLEAN;
    loader.RegisterFunction(infer_function);

    auto set_source_function = ScalarFunction(
        "nuban_set_bank_source",
        {LogicalType::VARCHAR},
        LogicalType::VARCHAR,
        NubanSetBankSourceFunction
    );
    loader.RegisterFunction(set_source_function);

    auto get_source_function = ScalarFunction(
        "nuban_get_bank_source",
        {},
        LogicalType::VARCHAR,
        NubanGetBankSourceFunction
    );
    loader.RegisterFunction(get_source_function);
}

} // namespace nuban
} // namespace duckdb
