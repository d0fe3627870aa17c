#include "vm.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/table.hpp"
#include "../bcvm-loader/deserializer.hpp"
#include "ops.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <fmt/core.h>

namespace bcvm {

  namespace {

    constexpr uint32_t kMaxTableHintLog2 = 16;

    struct DepthGuard {
      explicit DepthGuard(uint32_t &d) : depth(d) {
        ++depth;
      }
      ~DepthGuard() {
        --depth;
      }
      uint32_t &depth;
    };

    std::string describe_key(const Value &key) {
      if (key.isString())
        return fmt::format("'{}'", key.asString());
      return typeName(key.type());
    }

    double for_number(const Value &v, const char *what) {
      if (auto n = toNumber(v))
        return *n;
      throw RuntimeFault(fmt::format("invalid 'for' {} (number expected, got {})", what, typeName(v.type())));
    }

    bool for_continues(double idx, double limit, double step) {
      return step > 0 ? idx <= limit : idx >= limit;
    }

  } // namespace

  VM::VM(std::shared_ptr<Module> module, TableRef env, Settings settings)
      : module_(std::move(module)), env_(std::move(env)), settings_(std::move(settings)) {}

  std::shared_ptr<Closure> VM::mainClosure() {
    return makeClosure(shared_from_this(), module_->main(), {});
  }

  ValueList VM::invoke(Closure &closure, const ValueList &args) {
    if (!alive_)
      return {};
    DepthGuard guard(depth_);
    CallFrame frame(closure.proto(), args);

    if (!settings_.errorHandling) {
      if (depth_ > settings_.maxCallDepth)
        throw RuntimeFault("stack overflow");
      return execute(closure, frame);
    }

    try {
      if (depth_ > settings_.maxCallDepth)
        throw RuntimeFault("stack overflow");
      return execute(closure, frame);
    } catch (const ScriptError &e) {
      if (e.reported())
        throw;
      raise(frame, e.payload());
    } catch (const VmError &e) {
      raise(frame, Value(std::string(e.what())));
    }
  }

  void VM::raise(const CallFrame &frame, const Value &payload) {
    const uint8_t op = frame.current < frame.proto.code.size() ? frame.proto.code[frame.current].original : OP_NOP;
    if (!payload.isString() && settings_.allowProxyErrors) {
      if (settings_.hooks.panic)
        settings_.hooks.panic(typeName(payload.type()), payload, context(frame, op));
      throw ScriptError(payload, true);
    }
    Value located(locate(frame, payload.isString() ? payload.asString() : typeName(payload.type())));
    if (settings_.hooks.panic)
      settings_.hooks.panic(located.asString(), located, context(frame, op));
    throw ScriptError(located, true);
  }

  std::string VM::locate(const CallFrame &frame, const std::string &message) const {
    const Prototype &p = frame.proto;
    if (p.lineInfoEnabled)
      return fmt::format("{}:{}: {}", p.debugName, p.lineAt(frame.current), message);
    const char *op = frame.current < p.code.size() ? opName(p.code[frame.current].original) : "?";
    return fmt::format("{}:pc {} ({}): {}", p.debugName, frame.current, op, message);
  }

  HookContext VM::context(const CallFrame &frame, uint8_t op) const {
    return HookContext{frame.proto, frame.registers, frame.current, frame.top, opName(op)};
  }

  void VM::interrupt(const CallFrame &frame, uint8_t op) {
    if (settings_.hooks.interrupt)
      settings_.hooks.interrupt(context(frame, op));
  }

  void VM::trace(const CallFrame &frame, const Instruction &inst) {
    if (settings_.traceLimit && traced_ >= settings_.traceLimit)
      return;
    ++traced_;
    fmt::print(stderr, "[trace] {}#{} {:<14} A={} B={} C={} D={} aux={}\n", frame.proto.debugName, frame.current,
               opName(inst.opcode), inst.A, inst.B, inst.C, inst.D, inst.aux);
  }

  Value VM::getGlobal(const Value &key) const {
    if (settings_.extensions) {
      Value v = settings_.extensions->get(key);
      if (!v.isNil())
        return v;
    }
    if (!env_)
      return Value();
    return env_->get(key);
  }

  void VM::setGlobal(const Value &key, Value v) {
    if (!env_)
      throw RuntimeFault(fmt::format("attempt to set global {} without an environment", describe_key(key)));
    env_->set(key, std::move(v));
  }

  Value VM::index(const Value &obj, const Value &key) const {
    if (obj.isTable())
      return obj.asTable()->get(key);
    if (obj.isString() && settings_.stringMethods)
      return settings_.stringMethods->get(key);
    if (obj.isVector() && key.isString()) {
      const Vector &v = obj.asVector();
      const std::string &k = key.asString();
      if (k == "x" || k == "X")
        return (double)v.x;
      if (k == "y" || k == "Y")
        return (double)v.y;
      if (k == "z" || k == "Z")
        return (double)v.z;
      if (settings_.vectorSize == 4 && (k == "w" || k == "W"))
        return (double)v.w;
    }
    throw RuntimeFault(fmt::format("attempt to index {} with {}", typeName(obj.type()), describe_key(key)));
  }

  void VM::setIndex(const Value &obj, const Value &key, Value v) {
    if (!obj.isTable())
      throw RuntimeFault(fmt::format("attempt to index {} with {}", typeName(obj.type()), describe_key(key)));
    obj.asTable()->set(key, std::move(v));
  }

  ValueList VM::callValue(const Value &fn, const ValueList &args) {
    if (!fn.isFunction())
      throw RuntimeFault(fmt::format("attempt to call a {} value", typeName(fn.type())));
    FunctionRef callee = fn.asFunction(); // the register may be overwritten during the call
    return callee->call(args);
  }

  void VM::storeResults(CallFrame &frame, uint32_t base, uint32_t wanted, const ValueList &results) {
    if (wanted == 0) {
      frame.ensure(base + results.size(), settings_.maxRegisters);
      std::copy(results.begin(), results.end(), frame.registers.begin() + base);
      frame.top = (int)(base + results.size()) - 1;
      return;
    }
    uint32_t n = wanted - 1;
    frame.ensure(base + n, settings_.maxRegisters);
    for (uint32_t i = 0; i < n; ++i)
      frame.registers[base + i] = i < results.size() ? results[i] : Value();
  }

  std::vector<UpvalueRef> VM::capture(CallFrame &frame, Closure &parent, const Prototype &child, bool allowRef) {
    auto &code = frame.proto.code;
    std::vector<UpvalueRef> ups;
    ups.reserve(child.numUpvalues);
    for (uint32_t i = 0; i < child.numUpvalues; ++i) {
      if (frame.pc >= code.size() || code[frame.pc].opcode != OP_CAPTURE)
        throw RuntimeFault(fmt::format("expected CAPTURE {} of {} for closure {}", i + 1, child.numUpvalues, child.debugName));
      const Instruction &cap = code[frame.pc++];
      switch (cap.A) {
      case CAPTURE_VALUE:
        ups.push_back(std::make_shared<Upvalue>(frame.registers[cap.B]));
        break;
      case CAPTURE_REF:
        // shared closures never alias a frame slot
        if (allowRef)
          ups.push_back(frame.upvalues.open(cap.B));
        else
          ups.push_back(std::make_shared<Upvalue>(Value()));
        break;
      case CAPTURE_UPVAL:
        if (cap.B >= parent.upvalues().size())
          throw RuntimeFault(fmt::format("upvalue {} out of range", cap.B));
        ups.push_back(parent.upvalues()[cap.B]);
        break;
      default:
        throw RuntimeFault(fmt::format("unknown capture type {}", cap.A));
      }
    }
    return ups;
  }

  bool VM::namecall(CallFrame &frame, const Instruction &inst) {
    auto &code = frame.proto.code;
    if (!settings_.useNativeNamecall || !settings_.namecallHandler || frame.pc >= code.size())
      return false;
    const Instruction &callInst = code[frame.pc];
    if (callInst.opcode != OP_CALL)
      return false;

    auto fire_hooks = [&] {
      uint32_t saved = frame.current;
      frame.current  = frame.pc;
      if (settings_.hooks.step)
        settings_.hooks.step(context(frame, OP_CALL));
      interrupt(frame, OP_CALL);
      frame.current = saved;
    };

    if (settings_.namecallReinvokesHooks)
      fire_hooks();

    int nparams = callInst.B == 0 ? frame.top - (int)callInst.A : (int)callInst.B - 1;
    if (nparams < 0)
      nparams = 0;
    frame.ensure(callInst.A + 1 + nparams, settings_.maxRegisters);
    auto first = frame.registers.begin() + callInst.A + 1;
    ValueList args(first, first + nparams);
    const Value &key = inst.K.value;
    auto results = settings_.namecallHandler(key.isString() ? key.asString() : toString(key), args);
    if (!results)
      return false;

    if (!settings_.namecallReinvokesHooks)
      fire_hooks();
    frame.current = frame.pc++;
    storeResults(frame, callInst.A, callInst.C, *results);
    return true;
  }

  ValueList VM::execute(Closure &closure, CallFrame &frame) {
    Prototype &proto = frame.proto;
    auto &code       = proto.code;
    auto &R          = frame.registers;
    const auto &ups  = closure.upvalues();
    const auto &hooks = settings_.hooks;

    while (alive_ && frame.pc < code.size()) {
      frame.current     = frame.pc;
      Instruction &inst = code[frame.pc++];
      uint8_t op        = inst.opcode;

      if (settings_.trace)
        trace(frame, inst);
      if (hooks.step)
        hooks.step(context(frame, op));

      if (op == OP_BREAK) {
        if (hooks.breakpoint) {
          if (auto early = hooks.breakpoint(context(frame, op)))
            return *early;
        }
        op = inst.original;
        if (op == OP_BREAK)
          continue;
      }

      switch (op) {
      case OP_NOP:
      case OP_PREPVARARGS:
      case OP_FASTCALL:
      case OP_FASTCALL1:
        break;

      case OP_LOADNIL:
        R[inst.A] = Value();
        break;
      case OP_LOADB:
        R[inst.A] = inst.B != 0;
        frame.pc += inst.C;
        break;
      case OP_LOADN:
        R[inst.A] = (double)inst.D;
        break;
      case OP_LOADK:
        R[inst.A] = inst.K.value;
        break;
      case OP_LOADKX:
        R[inst.A] = inst.K.value;
        frame.pc += 1;
        break;
      case OP_MOVE:
        R[inst.A] = R[inst.B];
        break;

      case OP_GETGLOBAL:
        R[inst.A] = getGlobal(inst.K.value);
        frame.pc += 1;
        break;
      case OP_SETGLOBAL:
        setGlobal(inst.K.value, R[inst.A]);
        frame.pc += 1;
        break;

      case OP_GETUPVAL:
        if (inst.B >= ups.size())
          throw RuntimeFault(fmt::format("upvalue {} out of range", inst.B));
        R[inst.A] = ups[inst.B]->get();
        break;
      case OP_SETUPVAL:
        if (inst.B >= ups.size())
          throw RuntimeFault(fmt::format("upvalue {} out of range", inst.B));
        ups[inst.B]->set(R[inst.A]);
        break;
      case OP_CLOSEUPVALS:
        frame.upvalues.closeFrom(inst.A);
        break;

      case OP_GETIMPORT: {
        const ImportPath &path = inst.import;
        if (settings_.useImportConstants && path.resolved) {
          R[inst.A] = path.value;
        } else {
          Value v = getGlobal(path.k0);
          if (path.count >= 2)
            v = index(v, path.k1);
          if (path.count >= 3)
            v = index(v, path.k2);
          R[inst.A] = std::move(v);
        }
        frame.pc += 1;
        break;
      }

      case OP_GETTABLE:
        R[inst.A] = index(R[inst.B], R[inst.C]);
        break;
      case OP_SETTABLE:
        setIndex(R[inst.B], R[inst.C], R[inst.A]);
        break;
      case OP_GETTABLEKS:
        R[inst.A] = index(R[inst.B], inst.K.value);
        frame.pc += 1;
        break;
      case OP_SETTABLEKS:
        setIndex(R[inst.B], inst.K.value, R[inst.A]);
        frame.pc += 1;
        break;
      case OP_GETTABLEN:
        R[inst.A] = index(R[inst.B], Value((double)inst.C + 1));
        break;
      case OP_SETTABLEN:
        setIndex(R[inst.B], Value((double)inst.C + 1), R[inst.A]);
        break;

      case OP_NEWCLOSURE: {
        if (inst.D < 0 || (std::size_t)inst.D >= proto.children.size())
          throw RuntimeFault(fmt::format("child prototype {} out of range", inst.D));
        Prototype &child = module_->protos[proto.children[inst.D]];
        auto captured    = capture(frame, closure, child, true);
        R[inst.A]        = makeClosure(shared_from_this(), child, std::move(captured));
        break;
      }
      case OP_DUPCLOSURE: {
        if (inst.K.kind != ConstantKind::Closure || inst.K.proto >= module_->protos.size())
          throw RuntimeFault("DUPCLOSURE constant is not a closure");
        Prototype &child = module_->protos[inst.K.proto];
        auto captured    = capture(frame, closure, child, false);
        R[inst.A]        = makeClosure(shared_from_this(), child, std::move(captured));
        break;
      }

      case OP_NAMECALL: {
        Value self    = R[inst.B];
        R[inst.A + 1] = self;
        frame.pc += 1;
        if (!namecall(frame, inst))
          R[inst.A] = index(self, inst.K.value);
        break;
      }

      case OP_CALL: {
        interrupt(frame, op);
        uint32_t A  = inst.A;
        int nparams = inst.B == 0 ? frame.top - (int)A : (int)inst.B - 1;
        if (nparams < 0)
          nparams = 0;
        frame.ensure(A + 1 + nparams, settings_.maxRegisters);
        ValueList args(R.begin() + A + 1, R.begin() + A + 1 + nparams);
        ValueList results = callValue(R[A], args);
        storeResults(frame, A, inst.C, results);
        break;
      }

      case OP_RETURN: {
        interrupt(frame, op);
        uint32_t A = inst.A;
        int n      = inst.B == 0 ? frame.top - (int)A + 1 : (int)inst.B - 1;
        if (n <= 0)
          return {};
        frame.ensure(A + n, settings_.maxRegisters);
        return ValueList(R.begin() + A, R.begin() + A + n);
      }

      case OP_JUMP:
        frame.pc += inst.D;
        break;
      case OP_JUMPBACK:
        interrupt(frame, op);
        frame.pc += inst.D;
        break;
      case OP_JUMPX:
        interrupt(frame, op);
        frame.pc += inst.E;
        break;
      case OP_JUMPIF:
        if (R[inst.A].truthy())
          frame.pc += inst.D;
        break;
      case OP_JUMPIFNOT:
        if (!R[inst.A].truthy())
          frame.pc += inst.D;
        break;

      case OP_JUMPIFEQ:
      case OP_JUMPIFLE:
      case OP_JUMPIFLT:
      case OP_JUMPIFNOTEQ:
      case OP_JUMPIFNOTLE:
      case OP_JUMPIFNOTLT: {
        if (inst.aux >= R.size())
          throw RuntimeFault(fmt::format("register {} out of range", inst.aux));
        const Value &a = R[inst.A];
        const Value &b = R[inst.aux];
        bool cond      = false;
        switch (op) {
        case OP_JUMPIFEQ:
          cond = a == b;
          break;
        case OP_JUMPIFLE:
          cond = lessEqual(a, b);
          break;
        case OP_JUMPIFLT:
          cond = lessThan(a, b);
          break;
        case OP_JUMPIFNOTEQ:
          cond = a != b;
          break;
        case OP_JUMPIFNOTLE:
          cond = !lessEqual(a, b);
          break;
        default:
          cond = !lessThan(a, b);
          break;
        }
        frame.pc += cond ? inst.D : 1;
        break;
      }

      case OP_ADD:
        R[inst.A] = arith(ArithOp::Add, R[inst.B], R[inst.C]);
        break;
      case OP_SUB:
        R[inst.A] = arith(ArithOp::Sub, R[inst.B], R[inst.C]);
        break;
      case OP_MUL:
        R[inst.A] = arith(ArithOp::Mul, R[inst.B], R[inst.C]);
        break;
      case OP_DIV:
        R[inst.A] = arith(ArithOp::Div, R[inst.B], R[inst.C]);
        break;
      case OP_MOD:
        R[inst.A] = arith(ArithOp::Mod, R[inst.B], R[inst.C]);
        break;
      case OP_POW:
        R[inst.A] = arith(ArithOp::Pow, R[inst.B], R[inst.C]);
        break;
      case OP_IDIV:
        R[inst.A] = arith(ArithOp::IDiv, R[inst.B], R[inst.C]);
        break;
      case OP_ADDK:
        R[inst.A] = arith(ArithOp::Add, R[inst.B], inst.K.value);
        break;
      case OP_SUBK:
        R[inst.A] = arith(ArithOp::Sub, R[inst.B], inst.K.value);
        break;
      case OP_MULK:
        R[inst.A] = arith(ArithOp::Mul, R[inst.B], inst.K.value);
        break;
      case OP_DIVK:
        R[inst.A] = arith(ArithOp::Div, R[inst.B], inst.K.value);
        break;
      case OP_MODK:
        R[inst.A] = arith(ArithOp::Mod, R[inst.B], inst.K.value);
        break;
      case OP_POWK:
        R[inst.A] = arith(ArithOp::Pow, R[inst.B], inst.K.value);
        break;
      case OP_IDIVK:
        R[inst.A] = arith(ArithOp::IDiv, R[inst.B], inst.K.value);
        break;
      case OP_SUBRK:
        R[inst.A] = arith(ArithOp::Sub, inst.K.value, R[inst.C]);
        break;
      case OP_DIVRK:
        R[inst.A] = arith(ArithOp::Div, inst.K.value, R[inst.C]);
        break;

      case OP_AND:
        R[inst.A] = R[inst.B].truthy() ? R[inst.C] : R[inst.B];
        break;
      case OP_OR:
        R[inst.A] = R[inst.B].truthy() ? R[inst.B] : R[inst.C];
        break;
      case OP_ANDK:
        R[inst.A] = R[inst.B].truthy() ? inst.K.value : R[inst.B];
        break;
      case OP_ORK:
        R[inst.A] = R[inst.B].truthy() ? R[inst.B] : inst.K.value;
        break;

      case OP_CONCAT:
        R[inst.A] = concat(R, inst.B, inst.C);
        break;
      case OP_NOT:
        R[inst.A] = !R[inst.B].truthy();
        break;
      case OP_MINUS:
        R[inst.A] = negate(R[inst.B]);
        break;
      case OP_LENGTH:
        R[inst.A] = length(R[inst.B]);
        break;

      case OP_NEWTABLE: {
        // B is a log2 size hint; cap it so hostile operands cannot overflow the shift
        std::size_t hashSize = inst.B == 0 ? 0 : (std::size_t)1 << std::min<uint32_t>(inst.B - 1, kMaxTableHintLog2);
        R[inst.A]            = std::make_shared<Table>(std::min<uint32_t>(inst.aux, settings_.maxRegisters), hashSize);
        frame.pc += 1;
        break;
      }
      case OP_DUPTABLE:
        R[inst.A] = std::make_shared<Table>(0, inst.K.keys.size());
        break;
      case OP_SETLIST: {
        const Value &target = R[inst.A];
        if (!target.isTable())
          throw RuntimeFault(fmt::format("SETLIST target is a {} value", typeName(target.type())));
        int count = inst.C == 0 ? frame.top - (int)inst.B + 1 : (int)inst.C - 1;
        if (count > 0)
          frame.ensure(inst.B + count, settings_.maxRegisters);
        auto &t = *target.asTable();
        for (int i = 0; i < count; ++i)
          t.setInt((long long)inst.aux + i, R[inst.B + i]);
        frame.pc += 1;
        break;
      }

      case OP_FORNPREP: {
        double limit = for_number(R[inst.A], "limit");
        double step  = for_number(R[inst.A + 1], "step");
        double idx   = for_number(R[inst.A + 2], "initial value");
        R[inst.A]     = limit;
        R[inst.A + 1] = step;
        R[inst.A + 2] = idx;
        if (!for_continues(idx, limit, step))
          frame.pc += inst.D;
        break;
      }
      case OP_FORNLOOP: {
        interrupt(frame, op);
        double limit = R[inst.A].asNumber();
        double step  = R[inst.A + 1].asNumber();
        double idx   = R[inst.A + 2].asNumber() + step;
        R[inst.A + 2] = idx;
        if (for_continues(idx, limit, step))
          frame.pc += inst.D;
        break;
      }

      case OP_FORGPREP_INEXT:
      case OP_FORGPREP_NEXT:
        if (!R[inst.A].isFunction())
          throw RuntimeFault(fmt::format("attempt to iterate over a {} value", typeName(R[inst.A].type())));
        frame.pc += inst.D;
        break;
      case OP_FORGPREP: {
        const Value &it = R[inst.A];
        if (settings_.generalizedIteration && !it.isFunction()) {
          uint32_t loopPc = frame.pc + inst.D;
          if (loopPc >= code.size() || code[loopPc].opcode != OP_FORGLOOP)
            throw RuntimeFault(fmt::format("FORGPREP target {} is not a FORGLOOP", loopPc));
          uint32_t arity = (uint32_t)code[loopPc].K.value.asNumber();
          frame.addIterator(loopPc, makeIterationBridge(it, arity));
        }
        frame.pc += inst.D;
        break;
      }
      case OP_FORGLOOP: {
        interrupt(frame, op);
        uint32_t A     = inst.A;
        uint32_t arity = (uint32_t)inst.K.value.asNumber();
        frame.ensure(A + 3 + arity, settings_.maxRegisters);
        frame.top = (int)A + 6;
        const Value it = R[A];

        if (!settings_.generalizedIteration || it.isFunction()) {
          ValueList results = callValue(it, ValueList{R[A + 1], R[A + 2]});
          for (uint32_t i = 0; i < arity; ++i)
            R[A + 3 + i] = i < results.size() ? results[i] : Value();
          if (!R[A + 3].isNil()) {
            R[A + 2] = R[A + 3];
            frame.pc += inst.D;
          } else {
            frame.pc += 1;
          }
          break;
        }

        IterationBridge *bridge = frame.findIterator(frame.current);
        if (!bridge)
          throw RuntimeFault(fmt::format("attempt to iterate over a {} value", typeName(it.type())));
        auto values = bridge->step();
        if (!values) {
          frame.dropIterator(frame.current);
          frame.pc += 1;
          break;
        }
        for (uint32_t i = 0; i < arity; ++i)
          R[A + 3 + i] = (*values)[i];
        R[A + 2] = R[A + 3];
        frame.pc += inst.D;
        break;
      }

      case OP_GETVARARGS: {
        uint32_t A = inst.A;
        if (inst.B == 0) {
          uint32_t n = (uint32_t)frame.varargs.size();
          frame.ensure(A + n, settings_.maxRegisters);
          std::copy(frame.varargs.begin(), frame.varargs.end(), R.begin() + A);
          frame.top = (int)(A + n) - 1;
        } else {
          uint32_t n = inst.B - 1;
          frame.ensure(A + n, settings_.maxRegisters);
          for (uint32_t i = 0; i < n; ++i)
            R[A + i] = i < frame.varargs.size() ? frame.varargs[i] : Value();
        }
        break;
      }

      case OP_FASTCALL2:
      case OP_FASTCALL2K:
      case OP_FASTCALL3:
        frame.pc += 1;
        break;

      case OP_COVERAGE:
        ++inst.hits;
        break;

      case OP_JUMPXEQKNIL: {
        bool cond = R[inst.A].isNil();
        frame.pc += cond != inst.KN ? inst.D : 1;
        break;
      }
      case OP_JUMPXEQKB: {
        const Value &a = R[inst.A];
        bool cond      = a.isBoolean() && a.asBoolean() == inst.K.value.asBoolean();
        frame.pc += cond != inst.KN ? inst.D : 1;
        break;
      }
      case OP_JUMPXEQKN:
      case OP_JUMPXEQKS: {
        bool cond = R[inst.A] == inst.K.value;
        frame.pc += cond != inst.KN ? inst.D : 1;
        break;
      }

      case OP_NATIVECALL:
        throw RuntimeFault("NATIVECALL is not supported");
      case OP_CAPTURE:
        throw RuntimeFault("CAPTURE outside of a closure constructor");

      default:
        throw UnsupportedOpcode(op, fmt::format("unsupported opcode {}", (int)op));
      }
    }
    return {};
  }

  Entry load(std::shared_ptr<Module> module, TableRef env, Settings settings) {
    if (!module || module->protos.empty())
      throw std::invalid_argument("load: module has no prototypes");
    auto vm = std::make_shared<VM>(std::move(module), std::move(env), std::move(settings));
    Entry e;
    e.main  = vm->mainClosure();
    e.close = [vm] { vm->close(); };
    e.vm    = vm;
    return e;
  }

  Entry load(std::string_view bytecode, TableRef env, Settings settings) {
    auto module = deserialize(bytecode, settings);
    return load(std::move(module), std::move(env), std::move(settings));
  }

  CallResult protectedCall(const Value &fn, const ValueList &args) {
    CallResult r;
    try {
      if (!fn.isFunction())
        throw RuntimeFault(fmt::format("attempt to call a {} value", typeName(fn.type())));
      FunctionRef callee = fn.asFunction();
      r.values           = callee->call(args);
      r.ok               = true;
    } catch (const ScriptError &e) {
      r.error   = e.payload();
      r.message = e.what();
    } catch (const VmError &e) {
      r.message = e.what();
      r.error   = Value(r.message);
    }
    return r;
  }

} // namespace bcvm
