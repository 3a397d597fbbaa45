#include "test_stuff.h"
#include "../components/daikin_override/command_ledger.h"
#include "../components/daikin_override/confirmed_state_store.h"
#include "../components/daikin_override/debouncer.h"
#include "../components/daikin_override/field.h"
#include "../components/daikin_override/mismatch_detector.h"
#include "../components/daikin_override/override_classifier.h"
#include "../components/daikin_override/protection_policy.h"
#include "../components/daikin_override/settings_normalizer.h"
#include "../components/daikin_override/util.h"
#include <climits>

static Divergence make_divergence(Field field, const std::string &expected, const std::string &actual,
                                  DivergenceSource source = DivergenceSource::Poll)
{
    Divergence divergence;
    divergence.field = field;
    divergence.expected = expected;
    divergence.actual = actual;
    divergence.source = source;
    return divergence;
}

void test_util_wraparound()
{
    cout << "test_util_wraparound" << endl;

    assert(elapsed_ms(1000, 500) == 500);
    // millis() wrapped between the two readings
    assert(elapsed_ms(100, UINT32_MAX - 99) == 200);

    assert(is_before(5, 10));
    assert(!is_before(10, 5));
    assert(!is_before(10, 10));
    assert(is_before(UINT32_MAX - 10, 20)); // 20 is after the wrap

    float value = 0.0f;
    assert(parse_float("23.5", value) && value == 23.5f);
    assert(parse_float(" 24", value) && value == 24.0f);
    assert(!parse_float("--", value));
    assert(!parse_float("", value));
    assert(!parse_float("24C", value));

    assert(format_float(24.0f) == "24");
    assert(format_float(23.5f) == "23.5");
    assert(format_float(-0.0f) == "0");
    assert(to_lower("COOL") == "cool");
}

void test_field_table()
{
    cout << "test_field_table" << endl;

    assert(field_table().size() == 5);
    assert(field_from_key("pow").value() == Field::Power);
    assert(field_from_key("stemp").value() == Field::TargetTemperature);
    assert(field_from_key("f_rate").value() == Field::FanRate);
    assert(field_from_key("f_dir").value() == Field::FanDirection);
    assert(field_from_key("mode").value() == Field::Mode);
    assert(!field_from_key("otemp").has_value());

    assert(std::string(field_to_string(Field::TargetTemperature)) == "target_temperature");
    assert(find_field_info(Field::TargetTemperature)->rule == CompareRule::Temperature);
    assert(find_field_info(Field::FanRate)->rule == CompareRule::Exact);
}

void test_compare_values()
{
    cout << "test_compare_values" << endl;

    assert(compare_values(Field::Power, "1", "1", 0.5f) == CompareResult::Equal);
    assert(compare_values(Field::Power, "1", "0", 0.5f) == CompareResult::Different);
    assert(compare_values(Field::Mode, "cool", "heat", 0.5f) == CompareResult::Different);

    assert(compare_values(Field::TargetTemperature, "24", "24.0", 0.5f) == CompareResult::Equal);
    assert(compare_values(Field::TargetTemperature, "24", "24.2", 0.5f) == CompareResult::Equal);
    // A whole half-degree step is a change, not rounding
    assert(compare_values(Field::TargetTemperature, "24", "23.5", 0.5f) == CompareResult::Different);
    assert(compare_values(Field::TargetTemperature, "24", "23.5", 0.0f) == CompareResult::Different);
    assert(compare_values(Field::TargetTemperature, "18", "18.0", 0.0f) == CompareResult::Equal);
    assert(compare_values(Field::TargetTemperature, "24", "22", 0.5f) == CompareResult::Different);
    assert(compare_values(Field::TargetTemperature, "24", "--", 0.5f) == CompareResult::Incomparable);
    // Identical placeholders are still equal
    assert(compare_values(Field::TargetTemperature, "--", "--", 0.5f) == CompareResult::Equal);
}

void test_confirmed_state_store()
{
    cout << "test_confirmed_state_store" << endl;

    ConfirmedStateStore store;
    assert(store.empty());
    assert(!store.has_update());
    assert(!store.read(Field::Power).has_value());

    // Command responses never become confirmed state
    assert(!store.update(response_snapshot(10, {{Field::Power, "1"}})));
    assert(!store.read(Field::Power).has_value());

    assert(store.update(poll_snapshot(20, running_cool_24())));
    assert(store.read(Field::Power).value() == "1");
    assert(store.last_update() == 20);

    // Partial snapshot merges, absent fields keep their value
    assert(store.update(poll_snapshot(30, {{Field::TargetTemperature, "22"}})));
    assert(store.read(Field::TargetTemperature).value() == "22");
    assert(store.read(Field::Mode).value() == "cool");

    Snapshot snapshot = store.snapshot();
    assert(snapshot.origin() == SnapshotOrigin::Poll);
    assert(snapshot.timestamp() == 30);
    assert(snapshot.values().size() == 5);
}

void test_command_ledger()
{
    cout << "test_command_ledger" << endl;

    CommandLedger ledger(30000);
    ledger.set_protection_window(Field::TargetTemperature, 60000);
    assert(ledger.protection_window(Field::Power) == 30000);
    assert(ledger.protection_window(Field::TargetTemperature) == 60000);

    const CommandIntent &first = ledger.record_intent(Field::Power, "1", 1000);
    uint32_t first_sequence = first.sequence;
    assert(ledger.active_intent(Field::Power, 1000).has_value());
    assert(ledger.active_intent(Field::Power, 31000).has_value()); // window boundary is inclusive
    assert(!ledger.active_intent(Field::Power, 31001).has_value());

    // Superseding command replaces the intent and restarts its window
    ledger.record_intent(Field::Power, "0", 20000);
    auto intent = ledger.active_intent(Field::Power, 45000);
    assert(intent.has_value());
    assert(intent->target == "0");
    assert(intent->sequence > first_sequence);
    assert(ledger.size() == 1);

    ledger.record_intent(Field::TargetTemperature, "18", 20000);
    assert(ledger.retarget(Field::TargetTemperature, "18.5"));
    assert(ledger.active_intent(Field::TargetTemperature, 20000)->target == "18.5");
    assert(ledger.active_intent(Field::TargetTemperature, 20000)->issued_at == 20000);
    assert(!ledger.retarget(Field::FanRate, "3"));

    // Power expires at 50000, temperature (60s window) stays
    auto expired = ledger.expire(50001);
    assert(expired.size() == 1);
    assert(expired[0].field == Field::Power);
    assert(!ledger.has_intent(Field::Power));
    assert(ledger.has_intent(Field::TargetTemperature));

    assert(ledger.clear(Field::TargetTemperature));
    assert(!ledger.clear(Field::TargetTemperature));
    assert(ledger.size() == 0);
}

void test_command_ledger_wraparound()
{
    cout << "test_command_ledger_wraparound" << endl;

    CommandLedger ledger(30000);
    ledger.record_intent(Field::Mode, "heat", UINT32_MAX - 5000);
    assert(ledger.active_intent(Field::Mode, 10000).has_value());
    assert(!ledger.active_intent(Field::Mode, 30000).has_value());
}

void test_mismatch_detector()
{
    cout << "test_mismatch_detector" << endl;

    MismatchDetector detector(0.5f);
    ConfirmedStateStore store;

    // Nothing confirmed yet: unknown is not a mismatch
    assert(detector.detect(poll_snapshot(10, running_cool_24()), store).empty());

    store.update(poll_snapshot(10, running_cool_24()));

    auto divergences = detector.detect(poll_snapshot(20, with(with(running_cool_24(), Field::FanRate, "3"), Field::Power, "0")), store);
    assert(divergences.size() == 2);
    assert(divergences[0].field == Field::Power);
    assert(divergences[0].expected == "1");
    assert(divergences[0].actual == "0");
    assert(divergences[0].source == DivergenceSource::Poll);
    assert(divergences[1].field == Field::FanRate);

    // Source follows the snapshot origin
    divergences = detector.detect(response_snapshot(30, {{Field::Mode, "heat"}}), store);
    assert(divergences.size() == 1);
    assert(divergences[0].source == DivergenceSource::CommandTime);

    // Rounding within tolerance is not a divergence
    assert(detector.detect(poll_snapshot(40, {{Field::TargetTemperature, "24.2"}}), store).empty());
}

void test_mismatch_detector_incomparable_field()
{
    cout << "test_mismatch_detector_incomparable_field" << endl;

    LogCapture log;
    MismatchDetector detector(0.5f);
    ConfirmedStateStore store;
    store.update(poll_snapshot(10, running_cool_24()));

    // The unreadable setpoint is skipped, the power change still comes through
    auto divergences = detector.detect(poll_snapshot(20, {{Field::TargetTemperature, "abc"}, {Field::Power, "0"}}), store);
    assert(divergences.size() == 1);
    assert(divergences[0].field == Field::Power);
    assert(log.contains("Can't compare target_temperature"));
}

void test_protection_policy_rules()
{
    cout << "test_protection_policy_rules" << endl;

    ProtectionPolicy policy(0.5f);
    CommandLedger ledger(30000);
    ConfirmedStateStore store;
    store.update(poll_snapshot(0, {{Field::Power, "0"}, {Field::FanRate, "auto"}, {Field::Mode, "cool"}}));

    // No intent: real
    assert(policy.evaluate(make_divergence(Field::FanRate, "auto", "3"), ledger, store, 1000) == ProtectionVerdict::Real);

    // Intent target equals the observed value, confirmed hasn't caught up: in flight
    ledger.record_intent(Field::Power, "1", 1000);
    assert(policy.evaluate(make_divergence(Field::Power, "0", "1"), ledger, store, 5000) == ProtectionVerdict::CommandInFlight);

    // Intent pending, device shows a third value before confirming: still latency
    ledger.record_intent(Field::FanRate, "5", 1000);
    assert(policy.evaluate(make_divergence(Field::FanRate, "auto", "3"), ledger, store, 5000) == ProtectionVerdict::AwaitingConfirmation);

    // Intent for a value that was already confirmed, device now shows something else: external change
    ledger.record_intent(Field::Mode, "cool", 1000);
    assert(policy.evaluate(make_divergence(Field::Mode, "cool", "heat"), ledger, store, 5000) == ProtectionVerdict::ChangedAfterConfirmation);

    // Once the window has elapsed the intent no longer protects anything
    assert(policy.evaluate(make_divergence(Field::Power, "0", "1"), ledger, store, 31001) == ProtectionVerdict::Real);

    std::vector<Divergence> divergences{
        make_divergence(Field::Power, "0", "1"),
        make_divergence(Field::FanRate, "auto", "3"),
        make_divergence(Field::Mode, "cool", "heat"),
    };
    auto real = policy.filter(divergences, ledger, store, 5000);
    assert(real.size() == 1);
    assert(real[0].field == Field::Mode);
}

void test_protection_policy_temperature_tolerance()
{
    cout << "test_protection_policy_temperature_tolerance" << endl;

    ProtectionPolicy policy(0.5f);
    CommandLedger ledger(30000);
    ConfirmedStateStore store;
    store.update(poll_snapshot(0, {{Field::TargetTemperature, "24"}}));

    // Device reports the requested 21 with a conversion error
    ledger.record_intent(Field::TargetTemperature, "21", 0);
    assert(policy.evaluate(make_divergence(Field::TargetTemperature, "24", "21.1"), ledger, store, 1000) == ProtectionVerdict::CommandInFlight);
    // Half a degree off the request is a different setpoint
    assert(policy.evaluate(make_divergence(Field::TargetTemperature, "24", "21.5"), ledger, store, 1000) == ProtectionVerdict::AwaitingConfirmation);
}

void test_protection_policy_any_running_mode()
{
    cout << "test_protection_policy_any_running_mode" << endl;

    ProtectionPolicy policy(0.5f);
    CommandLedger ledger(30000);
    ConfirmedStateStore store;
    store.update(poll_snapshot(0, {{Field::Power, "0"}, {Field::Mode, "off"}}));

    // Power on without a mode: whatever mode the unit comes back in is ours
    ledger.record_intent(Field::Mode, "off", 1000, IntentMatch::AnyOther);
    auto intent = ledger.active_intent(Field::Mode, 1000);
    assert(intent.has_value());
    assert(intent->satisfied_by("cool", 0.5f));
    assert(intent->satisfied_by("heat", 0.5f));
    assert(!intent->satisfied_by("off", 0.5f));
    assert(intent->to_string().find("target:!off") != std::string::npos);

    assert(policy.evaluate(make_divergence(Field::Mode, "off", "cool"), ledger, store, 5000) == ProtectionVerdict::CommandInFlight);
    assert(policy.evaluate(make_divergence(Field::Mode, "off", "dry"), ledger, store, 5000) == ProtectionVerdict::CommandInFlight);
    assert(policy.evaluate(make_divergence(Field::Mode, "off", "cool"), ledger, store, 31001) == ProtectionVerdict::Real);

    // A clipped or explicit value makes it exact again
    assert(ledger.retarget(Field::Mode, "heat"));
    intent = ledger.active_intent(Field::Mode, 5000);
    assert(intent->match == IntentMatch::Exact);
    assert(!intent->satisfied_by("cool", 0.5f));
}

void test_classifier_priority()
{
    cout << "test_classifier_priority" << endl;

    OverrideClassifier classifier;

    assert(!classifier.classify({}).has_value());
    assert(classifier.classify({make_divergence(Field::TargetTemperature, "24", "22")}).value() == OverrideCategory::Temperature);
    assert(classifier.classify({make_divergence(Field::FanRate, "auto", "3")}).value() == OverrideCategory::FanRate);
    assert(classifier.classify({make_divergence(Field::FanDirection, "off", "both")}).value() == OverrideCategory::FanDirection);
    assert(classifier.classify({make_divergence(Field::Mode, "cool", "heat")}).value() == OverrideCategory::Mode);

    // Power masks everything else
    assert(classifier.classify({make_divergence(Field::TargetTemperature, "24", "22"),
                                make_divergence(Field::Power, "1", "0")})
               .value() == OverrideCategory::Power);
    assert(classifier.classify({make_divergence(Field::Mode, "cool", "off"),
                                make_divergence(Field::FanRate, "auto", "3"),
                                make_divergence(Field::Power, "1", "0")})
               .value() == OverrideCategory::Power);

    // Several non-power fields: combined
    assert(classifier.classify({make_divergence(Field::FanRate, "auto", "3"),
                                make_divergence(Field::Mode, "cool", "heat")})
               .value() == OverrideCategory::Combined);
}

void test_classifier_event_keeps_all_divergences()
{
    cout << "test_classifier_event_keeps_all_divergences" << endl;

    OverrideClassifier classifier;
    auto event = classifier.build_event("living_room",
                                        {make_divergence(Field::Mode, "cool", "heat"),
                                         make_divergence(Field::FanRate, "auto", "3"),
                                         make_divergence(Field::TargetTemperature, "24", "26")},
                                        1234);
    assert(event.has_value());
    assert(event->device_id == "living_room");
    assert(event->category == OverrideCategory::Combined);
    assert(event->timestamp == 1234);
    assert(event->divergences.size() == 3);
    // Ordered by the priority table
    assert(event->divergences[0].field == Field::TargetTemperature);
    assert(event->divergences[1].field == Field::FanRate);
    assert(event->divergences[2].field == Field::Mode);

    std::string str = event->to_string();
    assert(str.find("category:combined") != std::string::npos);
    assert(str.find("target_temperature:24->26 (poll)") != std::string::npos);

    assert(!classifier.build_event("living_room", {}, 1234).has_value());
    assert(std::string(category_to_string(OverrideCategory::FanDirection)) == "swing");
}

void test_debouncer()
{
    cout << "test_debouncer" << endl;

    Debouncer debouncer(5000);
    OverrideEvent power;
    power.category = OverrideCategory::Power;
    OverrideEvent temperature;
    temperature.category = OverrideCategory::Temperature;

    assert(debouncer.admit(power, 1000));
    assert(!debouncer.admit(power, 3000));
    // Other categories are independent
    assert(debouncer.admit(temperature, 3000));
    // Suppressed repeats don't extend the cooldown
    assert(!debouncer.admit(power, 5999));
    assert(debouncer.admit(power, 6000));

    debouncer.reset();
    assert(debouncer.admit(power, 6001));
}

void test_normalizer()
{
    cout << "test_normalizer" << endl;

    SettingsNormalizer normalizer(1.0f);
    auto result = normalizer.normalize({{"pow", "1"}, {"mode", "COOL"}, {"stemp", "23.5"}, {"f_rate", "3"}, {"f_dir", "3d"}, {"otemp", "12"}},
                                       SnapshotOrigin::Poll, 500);
    const Snapshot &snapshot = result.snapshot;
    assert(snapshot.origin() == SnapshotOrigin::Poll);
    assert(snapshot.timestamp() == 500);
    assert(snapshot.get(Field::Power).value() == "1");
    assert(snapshot.get(Field::Mode).value() == "cool");
    assert(snapshot.get(Field::TargetTemperature).value() == "24");
    assert(snapshot.get(Field::FanRate).value() == "3");
    assert(snapshot.get(Field::FanDirection).value() == "both");
    assert(result.unknown_keys.size() == 1 && result.unknown_keys[0] == "otemp");
    assert(result.invalid_keys.empty());

    assert(normalizer.normalize_temperature("22.4") == "22");
    assert(normalizer.normalize_temperature("--").empty());
    assert(SettingsNormalizer(0.5f).normalize_temperature("22.3") == "22.5");
}

void test_normalizer_power_and_mode()
{
    cout << "test_normalizer_power_and_mode" << endl;

    SettingsNormalizer normalizer;

    // Mode "off" is the power switch
    auto off = normalizer.normalize({{"mode", "off"}, {"stemp", "--"}}, SnapshotOrigin::Poll, 0).snapshot;
    assert(off.get(Field::Power).value() == "0");
    assert(off.get(Field::Mode).value() == "off");
    assert(!off.has(Field::TargetTemperature));

    auto pow_off = normalizer.normalize({{"pow", "0"}, {"mode", "cool"}}, SnapshotOrigin::Poll, 0).snapshot;
    assert(pow_off.get(Field::Mode).value() == "off");

    auto running = normalizer.normalize({{"mode", "heat"}}, SnapshotOrigin::CommandResponse, 0).snapshot;
    assert(running.get(Field::Power).value() == "1");

    // Partial map stays partial
    auto fan_only = normalizer.normalize({{"f_rate", "quiet"}}, SnapshotOrigin::Poll, 0).snapshot;
    assert(fan_only.values().size() == 1);

    auto invalid = normalizer.normalize({{"pow", "maybe"}, {"f_dir", "diagonal"}, {"f_rate", "auto"}}, SnapshotOrigin::Poll, 0);
    assert(invalid.invalid_keys.size() == 2);
    assert(invalid.snapshot.values().size() == 1);
}

int main(int argc, char *argv[])
{
    test_util_wraparound();
    test_field_table();
    test_compare_values();

    test_confirmed_state_store();
    test_command_ledger();
    test_command_ledger_wraparound();

    test_mismatch_detector();
    test_mismatch_detector_incomparable_field();

    test_protection_policy_rules();
    test_protection_policy_temperature_tolerance();
    test_protection_policy_any_running_mode();

    test_classifier_priority();
    test_classifier_event_keeps_all_divergences();
    test_debouncer();

    test_normalizer();
    test_normalizer_power_and_mode();

    cout << "All component tests passed" << endl;
    return 0;
}
