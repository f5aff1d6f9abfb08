// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file contacts_demo.cpp
/// @brief Demonstrates fetched_results::FetchedResultsController
///
/// This example shows:
/// - Grouping a contact list into sections by team
/// - Receiving section and row events for each committed write
/// - Moves versus updates
/// - A persistent cache reused by a second controller
/// - Deleting the cache once no controller uses it

#include <fetched_results/error.h>
#include <fetched_results/memory_store.h>
#include <fetched_results/results_controller.h>

#include <iostream>
#include <memory>
#include <string>

using namespace fetched_results;

// ============================================================================
// Helpers
// ============================================================================

RawObject make_contact(const std::string& id, const std::string& team, const std::string& name,
                       const std::string& phone)
{
    return RawObject{"Contact", id}.set("team", team).set("name", name).set("phone", phone);
}

/// Prints the events a table view would animate
class PrintingListener : public ResultsListener {
public:
    void will_change_content(const FetchedResultsController&) override {
        std::cout << "  begin updates\n";
    }

    void did_change_section(const FetchedResultsController&, const ChangeEvent& event) override {
        std::cout << "    section: " << event << "\n";
    }

    void did_change_object(const FetchedResultsController&, const ChangeEvent& event) override {
        std::cout << "    row:     " << event << "\n";
    }

    void did_change_content(const FetchedResultsController& controller) override {
        std::cout << "  end updates (" << controller.number_of_sections() << " sections)\n";
    }
};

void print_table(const FetchedResultsController& controller)
{
    for (std::size_t s = 0; s < controller.number_of_sections(); ++s) {
        std::cout << "  [" << controller.section_title(s).value_or("") << "]\n";
        for (std::size_t r = 0; r < controller.number_of_rows(s); ++r) {
            if (auto object = controller.object_at({s, r})) {
                std::cout << "    " << object->field("name").to_string() << "  " << object->field("phone").to_string()
                          << "\n";
            }
        }
    }
}

FetchRequest contacts_request()
{
    FetchRequest request;
    request.entity_name = "Contact";
    request.sort_descriptors = {{"team", true}, {"name", true}};
    request.tracked_key_paths = {"phone"};
    return request;
}

// ============================================================================
// Demo
// ============================================================================

void demo_live_updates(MemoryObjectStore& store, const std::shared_ptr<CacheStorage>& storage)
{
    std::cout << "\n=== Live updates ===\n";

    FetchedResultsController controller(store, contacts_request(),
                                        ControllerOptions{"team", "contacts", storage});
    PrintingListener listener;
    ScopedConnection conn = controller.add_listener(listener);

    if (!controller.perform_fetch()) {
        std::cout << "fetch failed\n";
        return;
    }
    print_table(controller);

    std::cout << "\nAdd Dana to a new team:\n";
    store.add(make_contact("c4", "Sales", "Dana", "555-0104"));

    std::cout << "\nRename Bob to Zed (sort key change):\n";
    store.add(make_contact("c2", "Engineering", "Zed", "555-0102"));

    std::cout << "\nNew phone for Alice (tracked attribute):\n";
    store.add(make_contact("c1", "Engineering", "Alice", "555-0199"));

    std::cout << "\nOne transaction:\n";
    store.begin_write();
    store.remove("Contact", "c3");
    store.add(make_contact("c5", "Engineering", "Eve", "555-0105"));
    store.commit_write();

    std::cout << "\n";
    print_table(controller);
}

void demo_cached_restart(MemoryObjectStore& store, const std::shared_ptr<CacheStorage>& storage)
{
    std::cout << "\n=== Restart with the cached layout ===\n";

    // Changed while no controller was running
    store.add(make_contact("c6", "Design", "Frank", "555-0106"));

    FetchedResultsController controller(store, contacts_request(),
                                        ControllerOptions{"team", "contacts", storage});
    PrintingListener listener;
    ScopedConnection conn = controller.add_listener(listener);

    controller.perform_fetch();
    std::cout << "  fetched " << controller.fetched_objects().size() << " contacts in "
              << controller.number_of_sections() << " sections, no events\n";

    try {
        FetchedResultsController::delete_cache(std::string{"contacts"}, storage);
    } catch (const PreconditionViolation& e) {
        std::cout << "  delete refused: " << e.what() << "\n";
    }
}

int main()
{
    std::cout << "FetchedResultsController Demo\n";

    MemoryObjectStore store;
    store.register_entity("Contact", {"team", "name", "phone"});
    store.begin_write();
    store.add(make_contact("c1", "Engineering", "Alice", "555-0101"));
    store.add(make_contact("c2", "Engineering", "Bob", "555-0102"));
    store.add(make_contact("c3", "Operations", "Carol", "555-0103"));
    store.commit_write();

    auto storage = std::make_shared<MemoryCacheStorage>();

    demo_live_updates(store, storage);
    demo_cached_restart(store, storage);

    FetchedResultsController::delete_cache(std::string{"contacts"}, storage);
    std::cout << "\nCache deleted\n";
    return 0;
}
