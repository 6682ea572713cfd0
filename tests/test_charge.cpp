#include <catch2/catch.hpp>
#include "../include/charge.hpp"

namespace {

Ticket makeTicket(SlotType type, time_t issuedAt)
{
  Ticket t;
  t.id = "t";
  t.slotId = "s";
  t.slotType = type;
  t.issuedAt = issuedAt;
  return t;
}

}

SCENARIO("Fixed strategy charges one hourly rate")
{
  const time_t t0 = 1769997600;
  FixedChargeStrategy fixed(20);

  CHECK(fixed.calculateCharge(makeTicket(SlotType::MEDIUM, t0), t0 + 2 * 3600) == Approx(40.0));
  CHECK(fixed.calculateCharge(makeTicket(SlotType::LARGE, t0), t0 + 2 * 3600) == Approx(40.0));
  CHECK(fixed.calculateCharge(makeTicket(SlotType::SMALL, t0), t0) == Approx(0.0));

  // 20 分钟 = 0.3333 小时, 最后一步才取两位小数
  CHECK(fixed.calculateCharge(makeTicket(SlotType::SMALL, t0), t0 + 20 * 60) == Approx(6.67));
  CHECK(FixedChargeStrategy(30).calculateCharge(makeTicket(SlotType::SMALL, t0), t0 + 3600) == Approx(30.0));

  // 出场时间早于入场时间按零计费
  CHECK(fixed.calculateCharge(makeTicket(SlotType::SMALL, t0), t0 - 3600) == Approx(0.0));
  CHECK(fixed.describe()["strategy"] == "fixed");
}

SCENARIO("Charges never decrease as time passes")
{
  const time_t t0 = 1769997600;
  FixedChargeStrategy fixed(20);
  DynamicChargeStrategy dynamic;
  Ticket ticket = makeTicket(SlotType::LARGE, t0);

  double lastFixed = 0;
  double lastDynamic = 0;
  for (time_t now = t0; now <= t0 + 48 * 3600; now += 7 * 60 + 13) {
    double f = fixed.calculateCharge(ticket, now);
    double d = dynamic.calculateCharge(ticket, now);
    CHECK(f >= lastFixed);
    CHECK(d >= lastDynamic);
    lastFixed = f;
    lastDynamic = d;
  }
}

SCENARIO("Dynamic strategy prices by slot type")
{
  const time_t t0 = 1769997600;
  DynamicChargeStrategy dynamic;

  CHECK(dynamic.calculateCharge(makeTicket(SlotType::SMALL, t0), t0 + 3600) == Approx(20.0));
  CHECK(dynamic.calculateCharge(makeTicket(SlotType::MEDIUM, t0), t0 + 3600) == Approx(30.0));
  CHECK(dynamic.calculateCharge(makeTicket(SlotType::LARGE, t0), t0 + 5400) == Approx(60.0));
  CHECK(dynamic.describe()["rates"]["MEDIUM"] == 30.0);

  WHEN("The rate table misses a slot type")
  {
    DynamicChargeStrategy partial({{SlotType::SMALL, 10}});
    CHECK(partial.calculateCharge(makeTicket(SlotType::SMALL, t0), t0 + 3600) == Approx(10.0));
    CHECK_THROWS_AS(partial.calculateCharge(makeTicket(SlotType::LARGE, t0), t0 + 3600), UnmappedSlotType);
  }
}
