#include <catch2/catch.hpp>
#include "../include/ticket.hpp"

SCENARIO("Ticket registry mints and invalidates tickets")
{
  auto& registry = TicketRegistry::getInstance();
  CHECK(&registry == &TicketRegistry::getInstance());

  const size_t before = registry.activeCount();
  Ticket a = registry.createTicket("AP27PEK9409", "slot-a", SlotType::MEDIUM, 100);
  Ticket b = registry.createTicket("AP27PEK9409", "slot-a", SlotType::MEDIUM, 100);

  CHECK(a.id != b.id);
  CHECK(a.code.size() == 64);
  CHECK(a.code != b.code);
  CHECK(registry.activeCount() == before + 2);

  Ticket found;
  REQUIRE(registry.findTicket(a.id, found));
  CHECK(found.vehicleId == "AP27PEK9409");
  CHECK(found.slotId == "slot-a");
  CHECK(found.issuedAt == 100);

  WHEN("A ticket is invalidated twice")
  {
    Ticket stored;
    CHECK(registry.invalidateTicket(a, stored));
    CHECK(stored.id == a.id);
    CHECK_FALSE(registry.invalidateTicket(a));
    CHECK_FALSE(registry.findTicket(a.id, found));
    CHECK(registry.invalidateTicket(b));
    CHECK(registry.activeCount() == before);
  }

  WHEN("A presented ticket has been altered")
  {
    Ticket forged = a;
    forged.issuedAt = 200;
    CHECK_FALSE(registry.invalidateTicket(forged));

    forged = a;
    forged.slotId = "slot-b";
    CHECK_FALSE(registry.invalidateTicket(forged));

    CHECK(registry.findTicket(a.id, found));
    CHECK(registry.invalidateTicket(a));
    CHECK(registry.invalidateTicket(b));
  }
}

SCENARIO("Tickets render their fields")
{
  Ticket t = TicketRegistry::getInstance().createTicket("KA01", "slot-x", SlotType::LARGE, 0);
  CHECK(t.toString().find("KA01") != std::string::npos);
  auto j = t.toJson();
  CHECK(j["license_plate"] == "KA01");
  CHECK(j["slot_type"] == "LARGE");
  CHECK(j["code"] == t.code);
  CHECK(TicketRegistry::getInstance().invalidateTicket(t));
}
