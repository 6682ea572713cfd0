#include <catch2/catch.hpp>
#include "../include/floor.hpp"
#include "../include/ticket.hpp"

#include <stdexcept>

SCENARIO("Slot types round-trip through their names")
{
  SlotType type;
  CHECK(slotTypeFromString("SMALL", type));
  CHECK(type == SlotType::SMALL);
  CHECK(slotTypeFromString("LARGE", type));
  CHECK(slotTypeToString(type) == "LARGE");
  CHECK_FALSE(slotTypeFromString("medium", type));
  CHECK_FALSE(slotTypeFromString("BUS", type));
}

SCENARIO("A new slot starts empty with a generated id")
{
  Slot a(SlotType::MEDIUM);
  Slot b(SlotType::MEDIUM);
  CHECK(a.getState() == SlotState::EMPTY);
  CHECK(a.getType() == SlotType::MEDIUM);
  CHECK_FALSE(a.getId().empty());
  CHECK(a.getId() != b.getId());
}

SCENARIO("Floor books the first empty slot of the requested type")
{
  Floor floor;
  floor.addSlot(Slot("s1", SlotType::SMALL));
  floor.addSlot(Slot("m1", SlotType::MEDIUM));
  floor.addSlot(Slot("m2", SlotType::MEDIUM));

  Ticket ticket;
  std::string msg;

  WHEN("Two medium vehicles arrive")
  {
    REQUIRE(floor.bookSlot(SlotType::MEDIUM, "CAR-1", 1000, ticket, msg));
    CHECK(ticket.slotId == "m1");
    CHECK(ticket.slotType == SlotType::MEDIUM);
    CHECK(ticket.vehicleId == "CAR-1");
    CHECK(ticket.issuedAt == 1000);

    REQUIRE(floor.bookSlot(SlotType::MEDIUM, "CAR-2", 1001, ticket, msg));
    CHECK(ticket.slotId == "m2");

    THEN("A third medium vehicle finds no slot and state is unchanged")
    {
      CHECK_FALSE(floor.bookSlot(SlotType::MEDIUM, "CAR-3", 1002, ticket, msg));
      CHECK(msg == "no slot available");
      CHECK(floor.countAvailable(SlotType::MEDIUM) == 0);
      CHECK(floor.countAvailable(SlotType::SMALL) == 1);
    }
  }

  WHEN("No slot of the type exists")
  {
    CHECK_FALSE(floor.bookSlot(SlotType::LARGE, "TRUCK", 1000, ticket, msg));
    CHECK(floor.countAvailable(SlotType::SMALL) == 1);
    CHECK(floor.countAvailable(SlotType::MEDIUM) == 2);
  }
}

SCENARIO("Floor releases only slots it owns and that are filled")
{
  Floor floor("F1");
  floor.addSlot(Slot("m1", SlotType::MEDIUM));

  Ticket ticket;
  std::string msg;
  REQUIRE(floor.bookSlot(SlotType::MEDIUM, "CAR-1", 0, ticket, msg));

  SlotState state;
  REQUIRE(floor.getSlotState("m1", state));
  CHECK(state == SlotState::FILLED);

  CHECK_FALSE(floor.releaseSlot("unknown"));
  CHECK(floor.releaseSlot("m1"));
  REQUIRE(floor.getSlotState("m1", state));
  CHECK(state == SlotState::EMPTY);

  // 已经空闲的车位再次释放返回 false
  CHECK_FALSE(floor.releaseSlot("m1"));
  CHECK_FALSE(floor.getSlotState("unknown", state));

  CHECK(TicketRegistry::getInstance().invalidateTicket(ticket));
}

SCENARIO("Adding a slot with a duplicate id is rejected")
{
  Floor floor;
  floor.addSlot(Slot("dup", SlotType::SMALL));
  CHECK_THROWS_AS(floor.addSlot(Slot("dup", SlotType::LARGE)), std::logic_error);
  CHECK(floor.slotCount() == 1);
}
