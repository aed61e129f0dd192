#pragma once

#include <algorithm>
#include <map>
#include <string>

#include <google/protobuf/util/time_util.h>
#include "protocol.pb.h"

namespace sim_devices
{

    using devsim::v1::ArgSpec;
    using devsim::v1::SignalSpec;
    using devsim::v1::SignalValue;
    using devsim::v1::Status;
    using devsim::v1::Value;
    using devsim::v1::ValueType;

    static constexpr const char *kProviderName = "device-sim";

    // -----------------------------
    // Common helpers
    // -----------------------------

    static inline google::protobuf::Timestamp now_ts()
    {
        return google::protobuf::util::TimeUtil::GetCurrentTime();
    }

    static inline double clamp(double v, double lo, double hi)
    {
        return std::max(lo, std::min(hi, v));
    }

    static inline bool value_is_type(const Value &v, ValueType t)
    {
        return v.type() == t;
    }

    static inline bool get_arg_bool(const std::map<std::string, Value> &args, const char *key, bool &out)
    {
        auto it = args.find(key);
        if (it == args.end())
            return false;
        if (!value_is_type(it->second, ValueType::VALUE_TYPE_BOOL))
            return false;
        out = it->second.bool_value();
        return true;
    }

    static inline bool get_arg_int64(const std::map<std::string, Value> &args, const char *key, int64_t &out)
    {
        auto it = args.find(key);
        if (it == args.end())
            return false;
        if (!value_is_type(it->second, ValueType::VALUE_TYPE_INT64))
            return false;
        out = it->second.int64_value();
        return true;
    }

    // Accepts INT64 too so clients need not care about literal types.
    static inline bool get_arg_double(const std::map<std::string, Value> &args, const char *key, double &out)
    {
        auto it = args.find(key);
        if (it == args.end())
            return false;
        if (value_is_type(it->second, ValueType::VALUE_TYPE_INT64))
        {
            out = static_cast<double>(it->second.int64_value());
            return true;
        }
        if (!value_is_type(it->second, ValueType::VALUE_TYPE_DOUBLE))
            return false;
        out = it->second.double_value();
        return true;
    }

    static inline bool get_arg_string(const std::map<std::string, Value> &args, const char *key, std::string &out)
    {
        auto it = args.find(key);
        if (it == args.end())
            return false;
        if (!value_is_type(it->second, ValueType::VALUE_TYPE_STRING))
            return false;
        out = it->second.string_value();
        return true;
    }

    static inline Value make_bool(bool b)
    {
        Value v;
        v.set_type(ValueType::VALUE_TYPE_BOOL);
        v.set_bool_value(b);
        return v;
    }

    static inline Value make_int64(int64_t i)
    {
        Value v;
        v.set_type(ValueType::VALUE_TYPE_INT64);
        v.set_int64_value(i);
        return v;
    }

    static inline Value make_double(double d)
    {
        Value v;
        v.set_type(ValueType::VALUE_TYPE_DOUBLE);
        v.set_double_value(d);
        return v;
    }

    static inline Value make_string(const std::string &s)
    {
        Value v;
        v.set_type(ValueType::VALUE_TYPE_STRING);
        v.set_string_value(s);
        return v;
    }

    static inline SignalValue make_signal_value(const std::string &id, const Value &value)
    {
        SignalValue sv;
        sv.set_signal_id(id);
        *sv.mutable_value() = value;
        *sv.mutable_timestamp() = now_ts();
        sv.set_quality(SignalValue::QUALITY_OK);
        return sv;
    }

    static inline SignalSpec make_signal(const std::string &id, const std::string &name, ValueType type,
                                         const std::string &unit = "", const std::string &desc = "")
    {
        SignalSpec s;
        s.set_signal_id(id);
        s.set_name(name);
        s.set_description(desc);
        s.set_value_type(type);
        s.set_unit(unit);
        s.set_poll_hint(true);
        return s;
    }

    static inline ArgSpec make_arg(const std::string &name, ValueType type, bool required,
                                   const std::string &desc = "", const std::string &unit = "")
    {
        ArgSpec a;
        a.set_name(name);
        a.set_type(type);
        a.set_required(required);
        a.set_description(desc);
        a.set_unit(unit);
        return a;
    }

    // -----------------------------
    // CallResult type
    // -----------------------------

    struct CallResult
    {
        Status::Code code = Status::CODE_OK;
        std::string message = "ok";
    };

    static inline CallResult ok() { return {Status::CODE_OK, "ok"}; }
    static inline CallResult bad(const std::string &m) { return {Status::CODE_INVALID_ARGUMENT, m}; }
    static inline CallResult nf(const std::string &m) { return {Status::CODE_NOT_FOUND, m}; }
    static inline CallResult precond(const std::string &m) { return {Status::CODE_FAILED_PRECONDITION, m}; }

} // namespace sim_devices
