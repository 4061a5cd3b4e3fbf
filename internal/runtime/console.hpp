#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace rtask::service {
class TaskService;
}

namespace rtask::runtime {

/*
  Line oriented operator console.

  One command per input line, one JSON document per output line.
  Failures are reported as {"error": {"code": ..., "message": ...}}.

    add <type> [json-object]    get <id>       cancel <id>
    list [state] [--sort=oldest|newest]
    events [task-id]            event <id>
    pause  resume  status  types  help  quit
*/
class Console {
 public:
  explicit Console(std::shared_ptr<rtask::service::TaskService> service);

  // Executes one command and returns the response line (without newline).
  // Sets *quit when the command asks the console to stop.
  std::string Execute(const std::string& line, bool* quit = nullptr);

  // Serves commands until end of input, `quit`, or keep_running() is false.
  void Run(std::istream& in, std::ostream& out, const std::function<bool()>& keep_running);

 private:
  std::string Dispatch(const std::string& command, std::istream& args, bool* quit);

  std::shared_ptr<rtask::service::TaskService> service_;
};

} // namespace rtask::runtime
