#include <optcell/traits.hpp>
#include <optcell/option_cell.hpp>
#include <optcell/mutex.hpp>
#include <iostream>
#include <string>

using namespace optcell;

struct Message {
    int id;
};

OPTCELL_MARK_SEND(Message)

// ============================================================================
// OptionCell is Send when T is Send, never Sync
// ============================================================================

static_assert(is_send<OptionCell<int>>::value, "OptionCell<int> should be Send");
static_assert(!is_sync<OptionCell<int>>::value, "OptionCell<int> should NOT be Sync");
static_assert(!is_send<const OptionCell<int>&>::value,
              "const OptionCell<int>& should NOT be Send (not Sync)");
static_assert(is_send<OptionCell<int>&>::value,
              "OptionCell<int>& should be Send (exclusive access)");

static_assert(!is_send<OptionCell<NonNull<int>>>::value,
              "OptionCell<NonNull<int>> should NOT be Send (raw pointer payload)");

// ============================================================================
// Option and Result follow their payloads
// ============================================================================

static_assert(is_send<Option<int>>::value, "Option<int> should be Send");
static_assert(is_sync<Option<int>>::value, "Option<int> should be Sync");
static_assert(!is_send<Option<NonNull<int>>>::value, "Option<NonNull<int>> should NOT be Send");
static_assert(is_send<Result<int, double>>::value, "Result<int, double> should be Send");
static_assert(!is_send<Result<int, NonNull<int>>>::value,
              "Result<int, NonNull<int>> should NOT be Send");

// ============================================================================
// Mutex makes a Send cell shareable
// ============================================================================

static_assert(is_sync<Mutex<OptionCell<int>>>::value,
              "Mutex<OptionCell<int>> should be Sync");
static_assert(is_send<const Mutex<OptionCell<int>>&>::value,
              "const Mutex<OptionCell<int>>& should be Send");
static_assert(!is_send<MutexGuard<OptionCell<int>>>::value,
              "MutexGuard should NOT be Send");

// ============================================================================
// Explicit opt-in
// ============================================================================

static_assert(!is_send<std::string>::value, "std::string is not marked Send");
static_assert(is_send<Message>::value, "Message was marked Send");
static_assert(is_explicitly_send<Message>::value, "Message was marked explicitly");
static_assert(is_send<OptionCell<Message>>::value, "OptionCell<Message> should be Send");
static_assert(is_sync<Mutex<OptionCell<Message>>>::value,
              "Mutex<OptionCell<Message>> should be Sync");

// ============================================================================
// Helper variables
// ============================================================================

static_assert(Send<OptionCell<int>>, "OptionCell<int> satisfies Send");
static_assert(!Sync<OptionCell<int>>, "OptionCell<int> does NOT satisfy Sync");
static_assert(!ThreadSafe<OptionCell<int>>, "OptionCell<int> is NOT ThreadSafe");
static_assert(ThreadSafe<Mutex<OptionCell<int>>>, "Mutex<OptionCell<int>> is ThreadSafe");

int main() {
    std::cout << "All trait tests passed!\n";

    std::cout << "Checking Send/Sync traits at runtime:\n";
    std::cout << "  OptionCell<int> is Send: " << is_send<OptionCell<int>>::value << "\n";
    std::cout << "  OptionCell<int> is Sync: " << is_sync<OptionCell<int>>::value << "\n";
    std::cout << "  Mutex<OptionCell<int>> is Sync: "
              << is_sync<Mutex<OptionCell<int>>>::value << "\n";

    return 0;
}
